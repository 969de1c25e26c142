#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/task_graph.hpp"

namespace sprintgate {

enum class SprintStatus {
    Planned,
    InProgress,
    Completed,
};

enum class ValidationOutcome {
    Passed,
    Failed,
};

const char* to_string(SprintStatus status);
std::optional<SprintStatus> parse_sprint_status(const std::string& value);

const char* to_string(ValidationOutcome outcome);
std::optional<ValidationOutcome> parse_validation_outcome(const std::string& value);

struct HistoryEntry {
    std::string timestamp;
    std::string event;
    std::string subject;
    std::string detail;
};

// Appended by the external validator's report; never edited afterwards.
struct ValidationRecord {
    std::string milestone;
    std::string timestamp;
    ValidationOutcome status = ValidationOutcome::Passed;
    std::vector<std::string> issues;
};

struct ProgressTracker {
    std::string sprint_id;
    SprintStatus status = SprintStatus::Planned;
    std::string current_milestone;
    bool validation_pending = false;
    int completed_tasks = 0;
    int total_tasks = 0;
    std::vector<HistoryEntry> history;
    std::vector<ValidationRecord> validations;

    void append_history(std::string timestamp, std::string event, std::string subject, std::string detail = {});
    void refresh_counters(const TaskGraph& graph);
};

namespace model {

ProgressTracker progress_from_json(const nlohmann::json& j, std::vector<std::string>& issues);
nlohmann::json to_json(const ProgressTracker& progress);
nlohmann::json to_json(const ValidationRecord& record);

}

}
