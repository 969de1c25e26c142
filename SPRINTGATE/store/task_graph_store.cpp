#include "store/task_graph_store.hpp"

#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "store/errors.hpp"
#include "store/state_validator.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace sprintgate::store {
namespace {

// Missing optional documents come back as an empty object so defaults apply.
nlohmann::json read_document(const fs::path& path, bool required, std::vector<std::string>& issues) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (required) {
            issues.push_back(path.filename().string() + ": missing");
        }
        return nlohmann::json::object();
    }
    auto contents = read_file(path);
    if (!contents) {
        issues.push_back(path.filename().string() + ": cannot be read");
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(*contents);
    } catch (const nlohmann::json::parse_error& e) {
        issues.push_back(path.filename().string() + ": " + e.what());
        return nlohmann::json::object();
    }
}

struct Document {
    fs::path path;
    std::string payload;
};

}

StoreOptions StoreOptions::from_guardrails(const GuardrailConfig& guardrails) {
    StoreOptions options;
    options.backup_retention = guardrails.backup_retention;
    options.lock.timeout = std::chrono::milliseconds(guardrails.lock_timeout_ms);
    options.lock.retry_interval = std::chrono::milliseconds(guardrails.lock_retry_ms);
    return options;
}

TaskGraphStore::TaskGraphStore(fs::path state_dir, StoreOptions options)
    : paths_(std::move(state_dir)),
      options_(std::move(options)) {
    if (!options_.writer) {
        options_.writer = write_file_atomic;
    }
    if (!options_.clock) {
        options_.clock = time::system_clock();
    }
}

GuardrailConfig TaskGraphStore::peek_guardrails(const StatePaths& paths) {
    std::vector<std::string> issues;
    const auto document = read_document(paths.guardrails(), false, issues);
    GuardrailConfig config = model::guardrails_from_json(document, issues);
    if (!issues.empty()) {
        log::debug("[TaskGraphStore] guardrails.json has " + std::to_string(issues.size()) +
                   " issue(s); load() will report them");
    }
    return config;
}

BackupManager TaskGraphStore::make_backup_manager() const {
    return BackupManager(paths_, options_.backup_retention, options_.clock);
}

SprintState TaskGraphStore::read_state() const {
    std::vector<std::string> issues;
    SprintState state;
    state.graph = model::task_graph_from_json(read_document(paths_.task_graph(), true, issues), issues);
    state.progress = model::progress_from_json(read_document(paths_.progress(), true, issues), issues);
    state.deferred = model::deferred_features_from_json(read_document(paths_.deferred_features(), false, issues), issues);
    state.guardrails = model::guardrails_from_json(read_document(paths_.guardrails(), false, issues), issues);
    state.approved_stack = model::approved_stack_from_json(read_document(paths_.approved_stack(), false, issues), issues);
    if (!issues.empty()) {
        log::error("[TaskGraphStore] " + std::to_string(issues.size()) + " schema issue(s) in " + paths_.root.string());
        throw SchemaError(std::move(issues));
    }
    validate_state(state);
    return state;
}

bool TaskGraphStore::commit_pending() const {
    std::error_code ec;
    return fs::exists(paths_.commit_marker(), ec);
}

void TaskGraphStore::begin_commit(const BackupInfo& backup) const {
    std::ostringstream errors;
    if (!write_file_atomic(paths_.commit_marker(), backup.timestamp + "\n", errors)) {
        throw StateCorruptionOnWrite("cannot write commit marker; nothing was changed", {errors.str()});
    }
}

void TaskGraphStore::end_commit() const {
    std::error_code ec;
    fs::remove(paths_.commit_marker(), ec);
    if (ec) {
        // Left in place, the marker would roll this commit back on the next invocation.
        throw StateCorruptionOnWrite("cannot clear commit marker '" + paths_.commit_marker().string() +
                                     "': " + ec.message());
    }
}

void TaskGraphStore::recover_interrupted_commit() const {
    if (!commit_pending()) {
        return;
    }
    auto contents = read_file(paths_.commit_marker());
    const std::string timestamp = contents ? strings::trim_copy(*contents) : std::string();
    log::warn("[TaskGraphStore] Found an unfinished commit; rolling back to snapshot " + timestamp);
    try {
        make_backup_manager().restore(timestamp);
    } catch (const NotFound&) {
        throw StateCorruptionOnWrite("unfinished commit names snapshot '" + timestamp +
                                     "' which does not exist; run restore-backup with an earlier snapshot");
    }
    end_commit();
    log::info("[TaskGraphStore] Rolled back unfinished commit to snapshot " + timestamp);
}

SprintState TaskGraphStore::load() const {
    {
        FileLock lock(paths_.lock_file(), LockMode::Shared, options_.lock);
        if (!commit_pending()) {
            return read_state();
        }
    }
    FileLock lock(paths_.lock_file(), LockMode::Exclusive, options_.lock);
    recover_interrupted_commit();
    return read_state();
}

void TaskGraphStore::write_state(const SprintState& state, const BackupInfo& backup, BackupManager& backups) {
    // Serialize everything first so a dump failure cannot leave a half-written set.
    const std::vector<Document> documents = {
        {paths_.task_graph(), model::to_json(state.graph).dump(options_.indent) + "\n"},
        {paths_.progress(), model::to_json(state.progress).dump(options_.indent) + "\n"},
        {paths_.deferred_features(), model::to_json(state.deferred).dump(options_.indent) + "\n"},
        {paths_.guardrails(), model::to_json(state.guardrails).dump(options_.indent) + "\n"},
        {paths_.approved_stack(), model::to_json(state.approved_stack).dump(options_.indent) + "\n"},
    };

    std::vector<const Document*> changed;
    for (const auto& document : documents) {
        auto current = read_file(document.path);
        if (!current || *current != document.payload) {
            changed.push_back(&document);
        }
    }
    if (changed.empty()) {
        return;
    }

    begin_commit(backup);
    std::ostringstream errors;
    for (const Document* document : changed) {
        if (!options_.writer(document->path, document->payload, errors)) {
            log::error("[TaskGraphStore] Write of '" + document->path.string() + "' failed; restoring snapshot " +
                       backup.timestamp);
            std::vector<std::string> details = {errors.str()};
            try {
                backups.restore(backup.timestamp);
            } catch (const SprintError& restore_error) {
                // The marker stays, so the next invocation retries the rollback.
                details.push_back(std::string("restore failed: ") + restore_error.what());
                throw StateCorruptionOnWrite("write of '" + document->path.filename().string() +
                                                 "' failed and snapshot " + backup.timestamp +
                                                 " could not be restored",
                                             details);
            }
            end_commit();
            throw StateCorruptionOnWrite("write of '" + document->path.filename().string() +
                                             "' failed; state restored from snapshot " + backup.timestamp,
                                         details);
        }
    }
    end_commit();
}

SprintState TaskGraphStore::atomic_update(const Mutation& mutation) {
    FileLock lock(paths_.lock_file(), LockMode::Exclusive, options_.lock);
    recover_interrupted_commit();

    SprintState state = read_state();
    BackupManager backups = make_backup_manager();
    const BackupInfo backup = backups.create();

    mutation(state);
    state.progress.refresh_counters(state.graph);
    validate_state(state);

    write_state(state, backup, backups);
    backups.rotate();
    log::info("[TaskGraphStore] Committed update (snapshot " + backup.timestamp + ")");
    return state;
}

SprintState TaskGraphStore::initialize(const TaskGraph& graph, const GuardrailConfig& guardrails, const ApprovedStack& stack) {
    FileLock lock(paths_.lock_file(), LockMode::Exclusive, options_.lock);
    recover_interrupted_commit();

    std::error_code ec;
    if (fs::exists(paths_.task_graph(), ec)) {
        throw InvalidTransition("state directory '" + paths_.root.string() + "' already holds a task graph");
    }

    SprintState state;
    state.graph = graph;
    state.guardrails = guardrails;
    state.approved_stack = stack;
    state.progress.sprint_id = graph.sprint_id;
    state.progress.status = SprintStatus::Planned;
    if (!graph.milestones.empty()) {
        state.progress.current_milestone = graph.milestones.front().id;
    }
    state.progress.append_history(options_.clock(), "sprint_initialized", graph.sprint_id,
                                  std::to_string(graph.tasks.size()) + " task(s) in " +
                                      std::to_string(graph.milestones.size()) + " milestone(s)");
    state.progress.refresh_counters(state.graph);
    validate_state(state);

    BackupManager backups = make_backup_manager();
    const BackupInfo backup = backups.create();
    write_state(state, backup, backups);
    log::info("[TaskGraphStore] Initialized sprint " + graph.sprint_id + " in " + paths_.root.string());
    return state;
}

void TaskGraphStore::restore_backup(const std::string& timestamp) {
    FileLock lock(paths_.lock_file(), LockMode::Exclusive, options_.lock);
    recover_interrupted_commit();
    BackupManager backups = make_backup_manager();
    const BackupInfo safety = backups.create();
    begin_commit(safety);
    try {
        backups.restore(timestamp);
    } catch (const NotFound&) {
        end_commit();
        throw;
    }
    try {
        read_state();
    } catch (const SprintError&) {
        log::error("[TaskGraphStore] Snapshot " + timestamp + " fails validation; returning to " + safety.timestamp);
        backups.restore(safety.timestamp);
        end_commit();
        throw;
    }
    end_commit();
    backups.rotate();
    log::info("[TaskGraphStore] Restored snapshot " + timestamp + " (previous state kept as " + safety.timestamp + ")");
}

std::vector<BackupInfo> TaskGraphStore::backups() const {
    FileLock lock(paths_.lock_file(), LockMode::Shared, options_.lock);
    return make_backup_manager().list();
}

}
