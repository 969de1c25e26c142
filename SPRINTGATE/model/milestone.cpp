#include "model/milestone.hpp"

#include "model/json_fields.hpp"

namespace sprintgate {

const char* to_string(MilestoneStatus status) {
    switch (status) {
        case MilestoneStatus::NotStarted: return "not_started";
        case MilestoneStatus::InProgress: return "in_progress";
        case MilestoneStatus::Complete:   return "complete";
        case MilestoneStatus::Validated:  return "validated";
    }
    return "not_started";
}

std::optional<MilestoneStatus> parse_milestone_status(const std::string& value) {
    if (value == "not_started") return MilestoneStatus::NotStarted;
    if (value == "in_progress") return MilestoneStatus::InProgress;
    if (value == "complete") return MilestoneStatus::Complete;
    if (value == "validated") return MilestoneStatus::Validated;
    return std::nullopt;
}

namespace model {

Milestone milestone_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues) {
    Milestone milestone;
    FieldReader reader(j, where, issues, {"id", "title", "status", "tasks", "min_tasks", "max_tasks"});
    if (!reader.valid_object()) {
        return milestone;
    }
    milestone.id = reader.string("id", true);
    milestone.title = reader.string("title", false);
    milestone.tasks = reader.string_list("tasks", true);
    milestone.min_tasks = reader.optional_integer("min_tasks", 1);
    milestone.max_tasks = reader.optional_integer("max_tasks", 1);

    const std::string status = reader.string("status", false, "not_started");
    if (auto parsed = parse_milestone_status(status)) {
        milestone.status = *parsed;
    } else {
        issues.push_back(reader.path("status") + ": unknown milestone status '" + status + "'");
    }
    return milestone;
}

nlohmann::json to_json(const Milestone& milestone) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = milestone.id;
    j["title"] = milestone.title;
    j["status"] = to_string(milestone.status);
    j["tasks"] = milestone.tasks;
    if (milestone.min_tasks) {
        j["min_tasks"] = *milestone.min_tasks;
    }
    if (milestone.max_tasks) {
        j["max_tasks"] = *milestone.max_tasks;
    }
    return j;
}

}

}
