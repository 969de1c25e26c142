#pragma once

#include <filesystem>
#include <vector>

namespace sprintgate::store {

struct StatePaths {
    explicit StatePaths(std::filesystem::path root_dir);

    std::filesystem::path root;

    std::filesystem::path task_graph() const { return root / "task_graph.json"; }
    std::filesystem::path progress() const { return root / "progress.json"; }
    std::filesystem::path deferred_features() const { return root / "deferred_features.json"; }
    std::filesystem::path guardrails() const { return root / "guardrails.json"; }
    std::filesystem::path approved_stack() const { return root / "approved_stack.json"; }
    std::filesystem::path backups_dir() const { return root / "backups"; }
    std::filesystem::path lock_file() const { return root / ".sprint.lock"; }
    // Present only while a multi-file write is in flight; names the snapshot to roll back to.
    std::filesystem::path commit_marker() const { return root / ".commit"; }

    // Every file a snapshot covers, in a fixed order.
    std::vector<std::filesystem::path> state_files() const;
};

// SPRINTGATE_STATE_DIR when set, otherwise ./.sprint
std::filesystem::path default_state_dir();

}
