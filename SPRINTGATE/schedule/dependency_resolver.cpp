#include "schedule/dependency_resolver.hpp"

#include <algorithm>
#include <map>

#include "store/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace sprintgate::schedule {
namespace {

enum class Mark { Unvisited, OnStack, Done };

struct CycleSearch {
    const std::map<std::string, std::vector<std::string>>& adjacency;
    std::map<std::string, Mark> marks;
    std::vector<std::string> stack;

    std::optional<std::vector<std::string>> visit(const std::string& id) {
        marks[id] = Mark::OnStack;
        stack.push_back(id);
        auto it = adjacency.find(id);
        if (it != adjacency.end()) {
            for (const auto& dep : it->second) {
                if (adjacency.find(dep) == adjacency.end()) {
                    // Dangling ids are a schema problem, reported separately.
                    continue;
                }
                const Mark mark = marks[dep];
                if (mark == Mark::OnStack) {
                    auto start = std::find(stack.begin(), stack.end(), dep);
                    std::vector<std::string> cycle(start, stack.end());
                    cycle.push_back(dep);
                    return cycle;
                }
                if (mark == Mark::Unvisited) {
                    if (auto found = visit(dep)) {
                        return found;
                    }
                }
            }
        }
        stack.pop_back();
        marks[id] = Mark::Done;
        return std::nullopt;
    }
};

}

const char* to_string(SelectionOutcome outcome) {
    switch (outcome) {
        case SelectionOutcome::Selected:          return "selected";
        case SelectionOutcome::Blocked:           return "blocked";
        case SelectionOutcome::ValidationPending: return "validation_pending";
        case SelectionOutcome::SprintComplete:    return "sprint_complete";
    }
    return "blocked";
}

DependencyResolver::DependencyResolver(const TaskGraph& graph)
    : graph_(graph) {}

std::vector<std::string> DependencyResolver::unmet_dependencies(const Task& task) const {
    std::vector<std::string> unmet;
    for (const auto& dep_id : task.dependencies) {
        const Task* dep = graph_.find_task(dep_id);
        if (!dep || dep->status != TaskStatus::Completed) {
            unmet.push_back(dep_id);
        }
    }
    return unmet;
}

bool DependencyResolver::is_eligible(const Task& task) const {
    return task.status == TaskStatus::Pending && unmet_dependencies(task).empty();
}

std::vector<const Task*> DependencyResolver::eligible_tasks() const {
    std::vector<const Task*> eligible;
    for (const Task* task : graph_.declared_sequence()) {
        if (!task->is_validation() && is_eligible(*task)) {
            eligible.push_back(task);
        }
    }
    return eligible;
}

Selection DependencyResolver::next_task(const ProgressTracker& progress,
                                        const std::optional<std::string>& preferred_milestone) const {
    Selection selection;
    selection.milestone = progress.current_milestone;

    if (progress.status == SprintStatus::Completed) {
        selection.outcome = SelectionOutcome::SprintComplete;
        selection.reason = "every milestone is validated";
        return selection;
    }
    if (progress.validation_pending) {
        selection.outcome = SelectionOutcome::ValidationPending;
        selection.reason = "milestone " + progress.current_milestone + " is complete and awaiting validation";
        return selection;
    }

    const auto current_index = graph_.milestone_index(progress.current_milestone);
    const std::string target_id = preferred_milestone.value_or(progress.current_milestone);
    const auto target_index = graph_.milestone_index(target_id);
    if (!current_index || !target_index) {
        throw NotFound("milestone", !current_index ? progress.current_milestone : target_id);
    }
    selection.milestone = target_id;

    const Milestone& target = graph_.milestones[*target_index];
    if (*target_index > *current_index) {
        selection.outcome = SelectionOutcome::Blocked;
        selection.reason = "milestone " + target_id + " is locked until " + progress.current_milestone + " is validated";
        return selection;
    }

    std::vector<std::string> waiting;
    for (const auto& id : target.tasks) {
        const Task* task = graph_.find_task(id);
        if (!task || task->is_validation()) {
            continue;
        }
        if (is_eligible(*task)) {
            selection.outcome = SelectionOutcome::Selected;
            selection.task = task;
            selection.reason = "first eligible task of milestone " + target_id + " in declared order";
            log::debug("[DependencyResolver] Selected " + task->id);
            return selection;
        }
        if (task->status == TaskStatus::Pending) {
            waiting.push_back(task->id + " waits on " + strings::join(unmet_dependencies(*task), ", "));
        } else if (task->status == TaskStatus::InProgress) {
            waiting.push_back(task->id + " is in progress");
        }
    }

    selection.outcome = SelectionOutcome::Blocked;
    selection.reason = waiting.empty()
        ? "milestone " + target_id + " has no pending work; request validation once its tasks are complete"
        : "no eligible task in milestone " + target_id + ": " + strings::join(waiting, "; ");
    return selection;
}

const Task& DependencyResolver::require_startable(const ProgressTracker& progress, const std::string& task_id) const {
    const Task* task = graph_.find_task(task_id);
    if (!task) {
        throw NotFound("task", task_id);
    }
    if (progress.validation_pending) {
        throw ValidationPendingBlock(progress.current_milestone);
    }
    if (task->is_validation()) {
        throw InvalidTransition("task " + task_id + " is a validation task; it closes through record-validation");
    }
    if (task->status != TaskStatus::Pending) {
        throw InvalidTransition("task " + task_id + " is " + sprintgate::to_string(task->status) + ", not pending");
    }

    const auto unmet = unmet_dependencies(*task);
    if (!unmet.empty()) {
        throw DependencyUnsatisfied(task_id, unmet);
    }

    const auto current_index = graph_.milestone_index(progress.current_milestone);
    const auto task_index = graph_.milestone_index(task->milestone);
    if (current_index && task_index && *task_index > *current_index) {
        const Milestone& current = graph_.milestones[*current_index];
        if (current.status == MilestoneStatus::Complete) {
            throw ValidationPendingBlock(current.id);
        }
        throw InvalidTransition("task " + task_id + " belongs to milestone " + task->milestone +
                                ", which is locked until " + current.id + " is validated");
    }
    return *task;
}

std::optional<std::vector<std::string>> DependencyResolver::find_cycle(const TaskGraph& graph) {
    std::map<std::string, std::vector<std::string>> adjacency;
    for (const auto& task : graph.tasks) {
        auto& deps = adjacency[task.id];
        deps.insert(deps.end(), task.dependencies.begin(), task.dependencies.end());
    }
    CycleSearch search{adjacency, {}, {}};
    // Declared task order keeps the reported cycle stable between runs.
    for (const auto& task : graph.tasks) {
        if (search.marks[task.id] == Mark::Unvisited) {
            if (auto cycle = search.visit(task.id)) {
                return cycle;
            }
        }
    }
    return std::nullopt;
}

void DependencyResolver::cycle_check(const TaskGraph& graph) {
    if (auto cycle = find_cycle(graph)) {
        log::error("[DependencyResolver] Cycle: " + strings::join(*cycle, " -> "));
        throw CycleDetected(*cycle);
    }
}

}
