#include "model/task.hpp"

#include "model/json_fields.hpp"

namespace sprintgate {

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed:  return "completed";
    }
    return "pending";
}

std::optional<TaskStatus> parse_task_status(const std::string& value) {
    if (value == "pending") return TaskStatus::Pending;
    if (value == "in_progress") return TaskStatus::InProgress;
    if (value == "completed") return TaskStatus::Completed;
    return std::nullopt;
}

const char* to_string(TaskType type) {
    switch (type) {
        case TaskType::Implementation: return "implementation";
        case TaskType::Validation:     return "validation";
    }
    return "implementation";
}

std::optional<TaskType> parse_task_type(const std::string& value) {
    if (value == "implementation") return TaskType::Implementation;
    if (value == "validation") return TaskType::Validation;
    return std::nullopt;
}

namespace model {

ScopeBoundary scope_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues) {
    ScopeBoundary scope;
    FieldReader reader(j, where, issues, {"must_implement", "must_not_implement", "max_file_changes"});
    scope.must_implement = reader.string_list("must_implement", false);
    scope.must_not_implement = reader.string_list("must_not_implement", false);
    scope.max_file_changes = reader.optional_integer("max_file_changes", 0);
    return scope;
}

Task task_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues) {
    Task task;
    FieldReader reader(j, where, issues,
                       {"id", "title", "type", "status", "milestone", "dependencies", "scope", "technologies", "enhancement"});
    if (!reader.valid_object()) {
        return task;
    }

    task.id = reader.string("id", true);
    task.title = reader.string("title", true);
    task.milestone = reader.string("milestone", true);
    task.dependencies = reader.string_list("dependencies", false);
    task.technologies = reader.string_map("technologies");

    const std::string type = reader.string("type", false, "implementation");
    if (auto parsed = parse_task_type(type)) {
        task.type = *parsed;
    } else {
        issues.push_back(reader.path("type") + ": unknown task type '" + type + "'");
    }

    const std::string status = reader.string("status", false, "pending");
    if (auto parsed = parse_task_status(status)) {
        task.status = *parsed;
    } else {
        issues.push_back(reader.path("status") + ": unknown task status '" + status + "'");
    }

    if (const auto* scope = reader.object("scope", false)) {
        task.scope = scope_from_json(*scope, reader.path("scope"), issues);
    }

    if (const auto* enhancement = reader.object("enhancement", false)) {
        FieldReader enh_reader(*enhancement, reader.path("enhancement"), issues, {"id", "description", "added_at"});
        EnhancementInfo info;
        info.id = enh_reader.string("id", true);
        info.description = enh_reader.string("description", false);
        info.added_at = enh_reader.string("added_at", false);
        task.enhancement = std::move(info);
    }
    return task;
}

nlohmann::json to_json(const ScopeBoundary& scope) {
    nlohmann::json j = nlohmann::json::object();
    j["must_implement"] = scope.must_implement;
    j["must_not_implement"] = scope.must_not_implement;
    if (scope.max_file_changes) {
        j["max_file_changes"] = *scope.max_file_changes;
    }
    return j;
}

nlohmann::json to_json(const Task& task) {
    nlohmann::json j = nlohmann::json::object();
    j["id"] = task.id;
    j["title"] = task.title;
    j["type"] = to_string(task.type);
    j["status"] = to_string(task.status);
    j["milestone"] = task.milestone;
    j["dependencies"] = task.dependencies;
    j["scope"] = to_json(task.scope);
    if (!task.technologies.empty()) {
        j["technologies"] = task.technologies;
    }
    if (task.enhancement) {
        j["enhancement"] = {
            {"id", task.enhancement->id},
            {"description", task.enhancement->description},
            {"added_at", task.enhancement->added_at},
        };
    }
    return j;
}

}

}
