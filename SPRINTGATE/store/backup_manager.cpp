#include "store/backup_manager.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "store/atomic_file.hpp"
#include "store/errors.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace sprintgate::store {
namespace {

constexpr const char* kPartialSuffix = ".partial";

bool is_state_file_name(const StatePaths& paths, const std::string& name) {
    const auto files = paths.state_files();
    return std::any_of(files.begin(), files.end(), [&](const fs::path& p) { return p.filename().string() == name; });
}

// "20260101T000000.000Z-12" -> ("20260101T000000.000Z", 12); an unsuffixed stamp is collision 0.
std::pair<std::string, long> snapshot_key(const std::string& timestamp) {
    const auto dash = timestamp.rfind('-');
    if (dash == std::string::npos || dash + 1 == timestamp.size()) {
        return {timestamp, 0};
    }
    const std::string suffix = timestamp.substr(dash + 1);
    if (suffix.find_first_not_of("0123456789") != std::string::npos || suffix.size() > 9) {
        return {timestamp, 0};
    }
    return {timestamp.substr(0, dash), std::stol(suffix)};
}

}

BackupManager::BackupManager(StatePaths paths, int retention, time::Clock clock)
    : paths_(std::move(paths)),
      retention_(std::max(1, retention)),
      clock_(clock ? std::move(clock) : time::system_clock()) {}

BackupInfo BackupManager::create() {
    std::error_code ec;
    fs::create_directories(paths_.backups_dir(), ec);
    if (ec) {
        throw StateCorruptionOnWrite("[BackupManager] cannot create '" + paths_.backups_dir().string() + "': " + ec.message());
    }

    // Same-millisecond snapshots get a numeric suffix so each stays independently addressable.
    const std::string base = time::compact(clock_());
    std::string stamp = base;
    for (int n = 1; fs::exists(paths_.backups_dir() / stamp) ||
                    fs::exists(paths_.backups_dir() / (stamp + kPartialSuffix)); ++n) {
        stamp = base + "-" + std::to_string(n);
    }

    // Built under a ".partial" name and renamed once complete, so list() never sees half a snapshot.
    const fs::path staging = paths_.backups_dir() / (stamp + kPartialSuffix);
    const fs::path target = paths_.backups_dir() / stamp;
    fs::create_directories(staging, ec);
    if (ec) {
        throw StateCorruptionOnWrite("[BackupManager] cannot create '" + staging.string() + "': " + ec.message());
    }

    BackupInfo info;
    info.timestamp = stamp;
    info.directory = target;
    for (const auto& file : paths_.state_files()) {
        if (!fs::exists(file, ec)) {
            continue;
        }
        fs::copy_file(file, staging / file.filename(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            const std::string reason = ec.message();
            fs::remove_all(staging, ec);
            throw StateCorruptionOnWrite("[BackupManager] cannot snapshot '" + file.string() + "': " + reason);
        }
        info.files.push_back(file.filename().string());
    }

    fs::rename(staging, target, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove_all(staging, ec);
        throw StateCorruptionOnWrite("[BackupManager] cannot finalize snapshot '" + target.string() + "': " + reason);
    }
    log::info("[BackupManager] Created snapshot " + stamp + " (" + std::to_string(info.files.size()) + " file(s))");
    return info;
}

void BackupManager::restore(const std::string& timestamp) const {
    const fs::path directory = paths_.backups_dir() / timestamp;
    std::error_code ec;
    if (timestamp.empty() || timestamp.find('/') != std::string::npos || !fs::is_directory(directory, ec)) {
        throw NotFound("backup", timestamp);
    }

    std::vector<std::string> failures;
    for (const auto& file : paths_.state_files()) {
        const fs::path snapshot = directory / file.filename();
        if (!fs::exists(snapshot, ec)) {
            if (fs::exists(file, ec)) {
                fs::remove(file, ec);
                if (ec) {
                    failures.push_back("remove " + file.string() + ": " + ec.message());
                }
            }
            continue;
        }
        auto contents = read_file(snapshot);
        if (!contents) {
            failures.push_back("read " + snapshot.string());
            continue;
        }
        std::ostringstream errors;
        if (!write_file_atomic(file, *contents, errors)) {
            failures.push_back(errors.str());
        }
    }

    if (!failures.empty()) {
        log::error("[BackupManager] Restore of " + timestamp + " incomplete");
        throw StateCorruptionOnWrite("[BackupManager] restore of snapshot " + timestamp + " failed", failures);
    }
    log::info("[BackupManager] Restored snapshot " + timestamp);
}

BackupInfo BackupManager::describe(const fs::path& directory) const {
    BackupInfo info;
    info.timestamp = directory.filename().string();
    info.directory = directory;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (it->is_regular_file() && is_state_file_name(paths_, name)) {
            info.files.push_back(name);
        }
    }
    std::sort(info.files.begin(), info.files.end());
    return info;
}

std::vector<BackupInfo> BackupManager::list() const {
    std::vector<BackupInfo> backups;
    std::error_code ec;
    if (!fs::is_directory(paths_.backups_dir(), ec)) {
        return backups;
    }
    for (fs::directory_iterator it(paths_.backups_dir(), ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory()) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (name.size() >= 8 && name.compare(name.size() - 8, 8, kPartialSuffix) == 0) {
            continue;
        }
        backups.push_back(describe(it->path()));
    }
    std::sort(backups.begin(), backups.end(), [](const BackupInfo& a, const BackupInfo& b) {
        return snapshot_key(a.timestamp) < snapshot_key(b.timestamp);
    });
    return backups;
}

std::vector<std::string> BackupManager::rotate() {
    std::vector<std::string> removed;
    auto backups = list();
    if (backups.size() <= static_cast<std::size_t>(retention_)) {
        return removed;
    }
    const std::size_t excess = backups.size() - static_cast<std::size_t>(retention_);
    for (std::size_t i = 0; i < excess; ++i) {
        std::error_code ec;
        fs::remove_all(backups[i].directory, ec);
        if (ec) {
            log::warn("[BackupManager] Could not remove old snapshot " + backups[i].timestamp + ": " + ec.message());
            continue;
        }
        removed.push_back(backups[i].timestamp);
    }
    if (!removed.empty()) {
        log::debug("[BackupManager] Rotated out " + std::to_string(removed.size()) + " snapshot(s)");
    }
    return removed;
}

}
