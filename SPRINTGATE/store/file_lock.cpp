#include "store/file_lock.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "store/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::store {

FileLock::FileLock(const std::filesystem::path& path, LockMode mode, LockOptions options)
    : path_(path),
      mode_(mode) {
    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StateCorruptionOnWrite("[FileLock] cannot create lock directory '" + parent.string() + "': " + ec.message());
        }
    }

    fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw StateCorruptionOnWrite("[FileLock] cannot open lock file '" + path_.string() + "': " + std::strerror(errno));
    }

    const int operation = (mode_ == LockMode::Exclusive ? LOCK_EX : LOCK_SH) | LOCK_NB;
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + options.timeout;
    while (true) {
        if (::flock(fd_, operation) == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EWOULDBLOCK) {
            const std::string reason = std::strerror(errno);
            ::close(fd_);
            fd_ = -1;
            throw StateCorruptionOnWrite("[FileLock] flock('" + path_.string() + "') failed: " + reason);
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            ::close(fd_);
            fd_ = -1;
            const long waited = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count());
            const std::string holder = read_holder(path_);
            log::warn("[FileLock] Gave up on '" + path_.string() + "' after " + std::to_string(waited) + "ms");
            throw LockContention(path_.string(), holder, waited);
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options.retry_interval, deadline - now));
    }

    if (mode_ == LockMode::Exclusive) {
        stamp_holder();
    }
    log::debug(std::string("[FileLock] Acquired ") + (mode_ == LockMode::Exclusive ? "exclusive" : "shared") +
               " lock on '" + path_.string() + "'");
}

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept
    : path_(std::move(other.path_)),
      mode_(other.mode_),
      fd_(std::exchange(other.fd_, -1)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

void FileLock::release() {
    if (fd_ < 0) {
        return;
    }
    if (mode_ == LockMode::Exclusive && ::ftruncate(fd_, 0) != 0) {
        log::debug("[FileLock] Could not clear holder stamp in '" + path_.string() + "'");
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    log::debug("[FileLock] Released '" + path_.string() + "'");
}

std::string FileLock::read_holder(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::string();
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return strings::trim_copy(contents);
}

void FileLock::stamp_holder() {
    const std::string stamp = "pid " + std::to_string(static_cast<long long>(::getpid())) +
                              " since " + time::utc_now_iso8601() + "\n";
    if (::ftruncate(fd_, 0) != 0 || ::pwrite(fd_, stamp.data(), stamp.size(), 0) < 0) {
        log::debug("[FileLock] Could not stamp holder into '" + path_.string() + "': " + std::strerror(errno));
    }
}

}
