#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "store/state_paths.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::store {

struct BackupInfo {
    std::string timestamp;
    std::filesystem::path directory;
    // File names captured in the snapshot; state files absent at snapshot time are not listed.
    std::vector<std::string> files;
};

// Timestamped full snapshots of the state files under <state>/backups/<timestamp>/.
class BackupManager {
public:
    BackupManager(StatePaths paths, int retention, time::Clock clock = time::system_clock());

    // Throws StateCorruptionOnWrite when the snapshot cannot be written completely.
    BackupInfo create();

    // Puts every state file back to its snapshot content; files the snapshot lacks are removed.
    // Throws NotFound for an unknown timestamp and StateCorruptionOnWrite if a file cannot be restored.
    void restore(const std::string& timestamp) const;

    // Oldest first.
    std::vector<BackupInfo> list() const;

    // Deletes the oldest snapshots beyond the retention count; returns the removed timestamps.
    std::vector<std::string> rotate();

    int retention() const { return retention_; }

private:
    BackupInfo describe(const std::filesystem::path& directory) const;

    StatePaths paths_;
    int retention_;
    time::Clock clock_;
};

}
