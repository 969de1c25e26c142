#include "doctest/doctest.h"

#include <chrono>
#include <cstdlib>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#include "store/errors.hpp"
#include "store/file_lock.hpp"
#include "test_support.hpp"

using namespace sprintgate;
using store::FileLock;
using store::LockMode;
using store::LockOptions;

namespace {

LockOptions quick(int timeout_ms) {
    LockOptions options;
    options.timeout = std::chrono::milliseconds(timeout_ms);
    options.retry_interval = std::chrono::milliseconds(5);
    return options;
}

}

TEST_CASE("exclusive lock contention fails fast with LockContention naming the holder") {
    const auto lock_path = testing::fresh_dir("file_lock_exclusive") / ".sprint.lock";

    FileLock holder(lock_path, LockMode::Exclusive, quick(100));
    REQUIRE(holder.held());
    CHECK(FileLock::read_holder(lock_path).rfind("pid ", 0) == 0);

    const auto start = std::chrono::steady_clock::now();
    try {
        FileLock second(lock_path, LockMode::Exclusive, quick(60));
        FAIL("second exclusive lock should not be granted");
    } catch (const LockContention& e) {
        CHECK(e.recoverable());
        CHECK(std::string(e.what()).find("holder: pid ") != std::string::npos);
    }
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    CHECK(waited.count() >= 50);
    CHECK(waited.count() < 2000);
}

TEST_CASE("shared locks coexist but exclude writers") {
    const auto lock_path = testing::fresh_dir("file_lock_shared") / ".sprint.lock";

    FileLock reader_a(lock_path, LockMode::Shared, quick(50));
    FileLock reader_b(lock_path, LockMode::Shared, quick(50));
    CHECK(reader_a.held());
    CHECK(reader_b.held());
    CHECK_THROWS_AS(FileLock(lock_path, LockMode::Exclusive, quick(30)), LockContention);
}

TEST_CASE("released lock is immediately available and its holder stamp is cleared") {
    const auto lock_path = testing::fresh_dir("file_lock_release") / ".sprint.lock";
    {
        FileLock first(lock_path, LockMode::Exclusive, quick(50));
        FileLock moved(std::move(first));
        CHECK_FALSE(first.held());
        CHECK(moved.held());
    }
    CHECK(FileLock::read_holder(lock_path).empty());

    FileLock again(lock_path, LockMode::Exclusive, quick(50));
    CHECK(again.held());
    again.release();
    CHECK_FALSE(again.held());
    FileLock third(lock_path, LockMode::Exclusive, quick(50));
    CHECK(third.held());
}

TEST_CASE("a lock holder that crashes releases the lock with its process") {
    const auto lock_path = testing::fresh_dir("file_lock_crash") / ".sprint.lock";

    int acquired[2];
    int finish[2];
    REQUIRE(pipe(acquired) == 0);
    REQUIRE(pipe(finish) == 0);

    const pid_t child = fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        close(acquired[0]);
        close(finish[1]);
        try {
            FileLock held(lock_path, LockMode::Exclusive, quick(500));
            const char ready = 'L';
            if (write(acquired[1], &ready, 1) != 1) {
                std::_Exit(3);
            }
            char go = 0;
            if (read(finish[0], &go, 1) < 0) {
                std::_Exit(4);
            }
            // Dies holding the lock; no destructor runs.
            std::_Exit(1);
        } catch (const std::exception&) {
            std::_Exit(2);
        }
    }

    close(acquired[1]);
    close(finish[0]);
    char ready = 0;
    REQUIRE(read(acquired[0], &ready, 1) == 1);
    CHECK_THROWS_AS(FileLock(lock_path, LockMode::Exclusive, quick(30)), LockContention);

    const char go = 'X';
    REQUIRE(write(finish[1], &go, 1) == 1);
    int status = 0;
    REQUIRE(waitpid(child, &status, 0) == child);
    REQUIRE(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 1);
    close(acquired[0]);
    close(finish[1]);

    // The stamp outlives the crash, but the lock does not.
    CHECK(FileLock::read_holder(lock_path).rfind("pid " + std::to_string(static_cast<long long>(child)) + " ", 0) == 0);
    const auto start = std::chrono::steady_clock::now();
    FileLock after(lock_path, LockMode::Exclusive, quick(200));
    CHECK(after.held());
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    CHECK(waited.count() < 200);
}
