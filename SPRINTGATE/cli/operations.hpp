#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/progress.hpp"
#include "store/errors.hpp"
#include "store/task_graph_store.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::cli {

constexpr int kExitOk = 0;
constexpr int kExitBlocked = 2;
constexpr int kExitFatal = 3;
constexpr int kExitUsage = 64;

struct ErrorInfo {
    std::string code;
    std::string message;
    bool recoverable = false;
    std::vector<std::string> details;
};

// What one invocation prints: {"ok", "operation", "result"} plus "error" only on failure.
struct OperationResult {
    std::string operation;
    bool ok = true;
    nlohmann::json result = nlohmann::json::object();
    std::optional<ErrorInfo> error;
    int exit_code = kExitOk;

    void fail(const SprintError& e);
    void fail(ErrorInfo info, int exit_code);
    nlohmann::json to_json() const;
};

// The operation surface consumed by surrounding tooling. Each call reloads state from disk.
class Operations {
public:
    explicit Operations(store::TaskGraphStore& store, time::Clock clock = time::system_clock());

    OperationResult init(const nlohmann::json& plan);
    OperationResult get_current_status();
    // With a task id, checks that exactly that task may start; otherwise selects the next one.
    OperationResult get_next_task(const std::optional<std::string>& task_id,
                                  const std::optional<std::string>& milestone_id = std::nullopt);
    OperationResult get_task_details(const std::string& task_id);
    OperationResult validate_dependencies(const std::string& task_id);
    OperationResult check_scope_compliance(const std::string& task_id,
                                           const std::optional<std::vector<std::string>>& changed_files,
                                           const std::optional<std::filesystem::path>& content_root);
    OperationResult start_task(const std::string& task_id);
    OperationResult complete_task(const std::string& task_id,
                                  const std::optional<std::vector<std::string>>& changed_files,
                                  const std::optional<std::filesystem::path>& content_root);
    OperationResult get_milestone_status(const std::string& milestone_id);
    OperationResult request_validation(const std::string& milestone_id);
    OperationResult record_validation(const std::string& milestone_id,
                                      ValidationOutcome outcome,
                                      const std::vector<std::string>& issues);
    OperationResult apply_enhancement(const std::string& description, const nlohmann::json& request, bool defer);
    OperationResult list_deferred();
    OperationResult list_backups();
    OperationResult restore_backup(const std::string& timestamp);

private:
    template <typename Body>
    OperationResult run(const char* operation, Body&& body);

    store::TaskGraphStore& store_;
    time::Clock clock_;
};

}
