#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "model/sprint_state.hpp"
#include "store/atomic_file.hpp"
#include "store/backup_manager.hpp"
#include "store/file_lock.hpp"
#include "store/state_paths.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::store {

struct StoreOptions {
    int backup_retention = 10;
    LockOptions lock;
    // Defaults to write_file_atomic.
    FileWriter writer;
    time::Clock clock = time::system_clock();
    int indent = 2;

    static StoreOptions from_guardrails(const GuardrailConfig& guardrails);
};

// Owns the state directory. Every call re-reads disk; nothing is cached between calls.
class TaskGraphStore {
public:
    using Mutation = std::function<void(SprintState&)>;

    explicit TaskGraphStore(std::filesystem::path state_dir, StoreOptions options = {});

    // Parses every state file under a shared lock and validates all invariants. A commit left
    // unfinished by a crashed writer is rolled back to its snapshot first, under the exclusive lock.
    // Throws SchemaError (every issue listed) or CycleDetected.
    SprintState load() const;

    // lock -> backup -> mutate in memory -> re-validate -> write temps and rename -> unlock.
    // Validation failures and exceptions from `mutation` leave the files untouched; a write failure
    // restores the just-taken backup and throws StateCorruptionOnWrite. Returns the committed state.
    SprintState atomic_update(const Mutation& mutation);

    // Creates the state directory from a planner-produced graph. Refuses to overwrite an existing graph.
    SprintState initialize(const TaskGraph& graph, const GuardrailConfig& guardrails, const ApprovedStack& stack);

    void restore_backup(const std::string& timestamp);
    std::vector<BackupInfo> backups() const;

    const StatePaths& paths() const { return paths_; }
    const StoreOptions& options() const { return options_; }

    // Reads guardrails.json without locking or validating; used before a store exists to size its lock.
    static GuardrailConfig peek_guardrails(const StatePaths& paths);

private:
    SprintState read_state() const;
    void write_state(const SprintState& state, const BackupInfo& backup, BackupManager& backups);
    BackupManager make_backup_manager() const;

    // Commit marker handling; callers hold the exclusive lock.
    void begin_commit(const BackupInfo& backup) const;
    void end_commit() const;
    bool commit_pending() const;
    void recover_interrupted_commit() const;

    StatePaths paths_;
    StoreOptions options_;
};

}
