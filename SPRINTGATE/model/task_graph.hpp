#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/milestone.hpp"
#include "model/task.hpp"

namespace sprintgate {

struct ScopeEnforcement {
    int default_max_file_changes = 10;
};

struct TaskGraph {
    std::string sprint_id;
    MilestoneStrategy milestone_strategy;
    ScopeEnforcement scope_enforcement;
    std::vector<Milestone> milestones;
    std::vector<Task> tasks;

    Task* find_task(const std::string& id);
    const Task* find_task(const std::string& id) const;
    Milestone* find_milestone(const std::string& id);
    const Milestone* find_milestone(const std::string& id) const;

    // Position in milestones[], or nullopt for an unknown id.
    std::optional<std::size_t> milestone_index(const std::string& id) const;

    int max_tasks_for(const Milestone& milestone) const;
    int min_tasks_for(const Milestone& milestone) const;
    int max_file_changes_for(const Task& task) const;

    // Milestone order first, then each milestone's task order. Used as the scheduling tie-break.
    std::vector<const Task*> declared_sequence() const;
};

namespace model {

TaskGraph task_graph_from_json(const nlohmann::json& j, std::vector<std::string>& issues);
nlohmann::json to_json(const TaskGraph& graph);

}

}
