#include "model/progress.hpp"

#include <algorithm>
#include <utility>

#include "model/json_fields.hpp"

namespace sprintgate {

const char* to_string(SprintStatus status) {
    switch (status) {
        case SprintStatus::Planned:    return "planned";
        case SprintStatus::InProgress: return "in_progress";
        case SprintStatus::Completed:  return "completed";
    }
    return "planned";
}

std::optional<SprintStatus> parse_sprint_status(const std::string& value) {
    if (value == "planned") return SprintStatus::Planned;
    if (value == "in_progress") return SprintStatus::InProgress;
    if (value == "completed") return SprintStatus::Completed;
    return std::nullopt;
}

const char* to_string(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::Passed: return "passed";
        case ValidationOutcome::Failed: return "failed";
    }
    return "failed";
}

std::optional<ValidationOutcome> parse_validation_outcome(const std::string& value) {
    if (value == "passed") return ValidationOutcome::Passed;
    if (value == "failed") return ValidationOutcome::Failed;
    return std::nullopt;
}

void ProgressTracker::append_history(std::string timestamp, std::string event, std::string subject, std::string detail) {
    history.push_back(HistoryEntry{std::move(timestamp), std::move(event), std::move(subject), std::move(detail)});
}

void ProgressTracker::refresh_counters(const TaskGraph& graph) {
    total_tasks = static_cast<int>(graph.tasks.size());
    completed_tasks = static_cast<int>(std::count_if(graph.tasks.begin(), graph.tasks.end(), [](const Task& t) {
        return t.status == TaskStatus::Completed;
    }));
}

namespace model {

ProgressTracker progress_from_json(const nlohmann::json& j, std::vector<std::string>& issues) {
    ProgressTracker progress;
    FieldReader reader(j, "progress", issues,
                       {"sprint_id", "status", "current_milestone", "validation_pending",
                        "completed_tasks", "total_tasks", "history", "validations"});
    if (!reader.valid_object()) {
        return progress;
    }
    progress.sprint_id = reader.string("sprint_id", true);
    progress.current_milestone = reader.string("current_milestone", true);
    progress.validation_pending = reader.boolean("validation_pending", true, false);
    progress.completed_tasks = reader.integer("completed_tasks", false, 0);
    progress.total_tasks = reader.integer("total_tasks", false, 0);

    const std::string status = reader.string("status", false, "planned");
    if (auto parsed = parse_sprint_status(status)) {
        progress.status = *parsed;
    } else {
        issues.push_back(reader.path("status") + ": unknown sprint status '" + status + "'");
    }

    if (const auto* history = reader.array("history", false)) {
        for (std::size_t i = 0; i < history->size(); ++i) {
            FieldReader entry((*history)[i], reader.path("history", i), issues,
                              {"timestamp", "event", "subject", "detail"});
            HistoryEntry h;
            h.timestamp = entry.string("timestamp", true);
            h.event = entry.string("event", true);
            h.subject = entry.string("subject", false);
            h.detail = entry.string("detail", false);
            progress.history.push_back(std::move(h));
        }
    }

    if (const auto* validations = reader.array("validations", false)) {
        for (std::size_t i = 0; i < validations->size(); ++i) {
            FieldReader entry((*validations)[i], reader.path("validations", i), issues,
                              {"milestone", "timestamp", "status", "issues"});
            ValidationRecord record;
            record.milestone = entry.string("milestone", true);
            record.timestamp = entry.string("timestamp", true);
            record.issues = entry.string_list("issues", false);
            const std::string outcome = entry.string("status", true);
            if (auto parsed = parse_validation_outcome(outcome)) {
                record.status = *parsed;
            } else if (!outcome.empty()) {
                issues.push_back(entry.path("status") + ": unknown validation status '" + outcome + "'");
            }
            progress.validations.push_back(std::move(record));
        }
    }
    return progress;
}

nlohmann::json to_json(const ValidationRecord& record) {
    return {
        {"milestone", record.milestone},
        {"timestamp", record.timestamp},
        {"status", to_string(record.status)},
        {"issues", record.issues},
    };
}

nlohmann::json to_json(const ProgressTracker& progress) {
    nlohmann::json j = nlohmann::json::object();
    j["sprint_id"] = progress.sprint_id;
    j["status"] = to_string(progress.status);
    j["current_milestone"] = progress.current_milestone;
    j["validation_pending"] = progress.validation_pending;
    j["completed_tasks"] = progress.completed_tasks;
    j["total_tasks"] = progress.total_tasks;
    j["history"] = nlohmann::json::array();
    for (const auto& h : progress.history) {
        j["history"].push_back({
            {"timestamp", h.timestamp},
            {"event", h.event},
            {"subject", h.subject},
            {"detail", h.detail},
        });
    }
    j["validations"] = nlohmann::json::array();
    for (const auto& record : progress.validations) {
        j["validations"].push_back(to_json(record));
    }
    return j;
}

}

}
