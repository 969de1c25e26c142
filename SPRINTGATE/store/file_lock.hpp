#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace sprintgate::store {

enum class LockMode {
    Shared,
    Exclusive,
};

struct LockOptions {
    std::chrono::milliseconds timeout{5000};
    std::chrono::milliseconds retry_interval{50};
};

// Scoped flock(2) on a lock file. The kernel drops the lock when the holding process dies,
// so a crashed invocation never leaves the state directory wedged.
// Throws LockContention when the lock cannot be taken within options.timeout.
class FileLock {
public:
    FileLock(const std::filesystem::path& path, LockMode mode, LockOptions options = {});
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool held() const { return fd_ >= 0; }
    LockMode mode() const { return mode_; }
    const std::filesystem::path& path() const { return path_; }

    void release();

    // "pid 1234 since 2026-10-18T21:52:00.123Z", or empty when nothing is recorded.
    static std::string read_holder(const std::filesystem::path& path);

private:
    void stamp_holder();

    std::filesystem::path path_;
    LockMode mode_ = LockMode::Exclusive;
    int fd_ = -1;
};

}
