#include "model/task_graph.hpp"

#include <algorithm>

#include "model/json_fields.hpp"

namespace sprintgate {

Task* TaskGraph::find_task(const std::string& id) {
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &(*it);
}

const Task* TaskGraph::find_task(const std::string& id) const {
    return const_cast<TaskGraph*>(this)->find_task(id);
}

Milestone* TaskGraph::find_milestone(const std::string& id) {
    auto it = std::find_if(milestones.begin(), milestones.end(), [&](const Milestone& m) { return m.id == id; });
    return it == milestones.end() ? nullptr : &(*it);
}

const Milestone* TaskGraph::find_milestone(const std::string& id) const {
    return const_cast<TaskGraph*>(this)->find_milestone(id);
}

std::optional<std::size_t> TaskGraph::milestone_index(const std::string& id) const {
    for (std::size_t i = 0; i < milestones.size(); ++i) {
        if (milestones[i].id == id) {
            return i;
        }
    }
    return std::nullopt;
}

int TaskGraph::max_tasks_for(const Milestone& milestone) const {
    return milestone.max_tasks.value_or(milestone_strategy.max_tasks);
}

int TaskGraph::min_tasks_for(const Milestone& milestone) const {
    return milestone.min_tasks.value_or(milestone_strategy.min_tasks);
}

int TaskGraph::max_file_changes_for(const Task& task) const {
    return task.scope.max_file_changes.value_or(scope_enforcement.default_max_file_changes);
}

std::vector<const Task*> TaskGraph::declared_sequence() const {
    std::vector<const Task*> sequence;
    sequence.reserve(tasks.size());
    for (const auto& milestone : milestones) {
        for (const auto& id : milestone.tasks) {
            if (const Task* task = find_task(id)) {
                sequence.push_back(task);
            }
        }
    }
    return sequence;
}

namespace model {

TaskGraph task_graph_from_json(const nlohmann::json& j, std::vector<std::string>& issues) {
    TaskGraph graph;
    FieldReader reader(j, "task_graph", issues,
                       {"sprint_id", "milestone_strategy", "scope_enforcement", "milestones", "tasks"});
    if (!reader.valid_object()) {
        return graph;
    }
    graph.sprint_id = reader.string("sprint_id", true);

    if (const auto* strategy = reader.object("milestone_strategy", false)) {
        FieldReader strategy_reader(*strategy, reader.path("milestone_strategy"), issues, {"min_tasks", "max_tasks"});
        graph.milestone_strategy.min_tasks = strategy_reader.integer("min_tasks", false, 3, 1);
        graph.milestone_strategy.max_tasks = strategy_reader.integer("max_tasks", false, 5, 1);
        if (graph.milestone_strategy.min_tasks > graph.milestone_strategy.max_tasks) {
            strategy_reader.report("min_tasks exceeds max_tasks");
        }
    }

    if (const auto* scope = reader.object("scope_enforcement", false)) {
        FieldReader scope_reader(*scope, reader.path("scope_enforcement"), issues, {"default_max_file_changes"});
        graph.scope_enforcement.default_max_file_changes = scope_reader.integer("default_max_file_changes", false, 10, 0);
    }

    if (const auto* milestones = reader.array("milestones", true)) {
        for (std::size_t i = 0; i < milestones->size(); ++i) {
            graph.milestones.push_back(milestone_from_json((*milestones)[i], reader.path("milestones", i), issues));
        }
    }
    if (const auto* tasks = reader.array("tasks", true)) {
        for (std::size_t i = 0; i < tasks->size(); ++i) {
            graph.tasks.push_back(task_from_json((*tasks)[i], reader.path("tasks", i), issues));
        }
    }
    return graph;
}

nlohmann::json to_json(const TaskGraph& graph) {
    nlohmann::json j = nlohmann::json::object();
    j["sprint_id"] = graph.sprint_id;
    j["milestone_strategy"] = {
        {"min_tasks", graph.milestone_strategy.min_tasks},
        {"max_tasks", graph.milestone_strategy.max_tasks},
    };
    j["scope_enforcement"] = {
        {"default_max_file_changes", graph.scope_enforcement.default_max_file_changes},
    };
    j["milestones"] = nlohmann::json::array();
    for (const auto& milestone : graph.milestones) {
        j["milestones"].push_back(to_json(milestone));
    }
    j["tasks"] = nlohmann::json::array();
    for (const auto& task : graph.tasks) {
        j["tasks"].push_back(to_json(task));
    }
    return j;
}

}

}
