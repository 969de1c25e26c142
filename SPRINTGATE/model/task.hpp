#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sprintgate {

enum class TaskStatus {
    Pending,
    InProgress,
    Completed,
};

enum class TaskType {
    Implementation,
    Validation,
};

const char* to_string(TaskStatus status);
std::optional<TaskStatus> parse_task_status(const std::string& value);

const char* to_string(TaskType type);
std::optional<TaskType> parse_task_type(const std::string& value);

struct ScopeBoundary {
    std::vector<std::string> must_implement;
    std::vector<std::string> must_not_implement;
    // Unset means the graph-wide scope_enforcement default applies.
    std::optional<int> max_file_changes;
};

struct EnhancementInfo {
    std::string id;
    std::string description;
    std::string added_at;
};

struct Task {
    std::string id;
    std::string title;
    TaskType type = TaskType::Implementation;
    TaskStatus status = TaskStatus::Pending;
    std::string milestone;
    std::vector<std::string> dependencies;
    ScopeBoundary scope;
    std::map<std::string, std::string> technologies;
    std::optional<EnhancementInfo> enhancement;

    bool is_validation() const { return type == TaskType::Validation; }
};

namespace model {

Task task_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues);
nlohmann::json to_json(const Task& task);

ScopeBoundary scope_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues);
nlohmann::json to_json(const ScopeBoundary& scope);

}

}
