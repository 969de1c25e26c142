#include "store/state_validator.hpp"

#include <map>
#include <regex>
#include <set>

#include "schedule/dependency_resolver.hpp"
#include "store/errors.hpp"
#include "utils/log.hpp"

namespace sprintgate::store {
namespace {

void check_tasks(const TaskGraph& graph, std::vector<std::string>& issues) {
    std::set<std::string> seen;
    for (const auto& task : graph.tasks) {
        if (!seen.insert(task.id).second) {
            issues.push_back("task " + task.id + ": duplicate id");
        }
        for (const auto& dep : task.dependencies) {
            const Task* target = graph.find_task(dep);
            if (!target) {
                issues.push_back("task " + task.id + ": dependency '" + dep + "' does not exist");
                continue;
            }
            // Milestones open strictly in order, so a dependency may never sit in a later milestone.
            const auto own_index = graph.milestone_index(task.milestone);
            const auto dep_index = graph.milestone_index(target->milestone);
            if (own_index && dep_index && *dep_index > *own_index) {
                issues.push_back("task " + task.id + ": dependency '" + dep + "' is in milestone " + target->milestone +
                                 ", after its own milestone " + task.milestone);
            }
        }
        const Milestone* milestone = graph.find_milestone(task.milestone);
        if (!milestone) {
            issues.push_back("task " + task.id + ": milestone '" + task.milestone + "' does not exist");
            continue;
        }
        bool listed = false;
        for (const auto& id : milestone->tasks) {
            listed = listed || id == task.id;
        }
        if (!listed) {
            issues.push_back("task " + task.id + ": not listed by its milestone " + milestone->id);
        }
        if (task.is_validation() && task.status == TaskStatus::Completed &&
            milestone->status != MilestoneStatus::Validated) {
            issues.push_back("task " + task.id + ": validation task completed but milestone " + milestone->id +
                             " is " + to_string(milestone->status));
        }
    }
}

void check_milestones(const TaskGraph& graph, std::vector<std::string>& issues) {
    std::set<std::string> seen;
    std::map<std::string, std::string> owner;
    for (const auto& milestone : graph.milestones) {
        const std::string label = "milestone " + milestone.id;
        if (!seen.insert(milestone.id).second) {
            issues.push_back(label + ": duplicate id");
        }
        if (milestone.tasks.empty()) {
            issues.push_back(label + ": has no tasks; it must end with a validation task");
            continue;
        }

        int validation_count = 0;
        for (std::size_t i = 0; i < milestone.tasks.size(); ++i) {
            const std::string& id = milestone.tasks[i];
            auto [it, inserted] = owner.emplace(id, milestone.id);
            if (!inserted) {
                issues.push_back(label + ": task " + id + " is already listed by milestone " + it->second);
            }
            const Task* task = graph.find_task(id);
            if (!task) {
                issues.push_back(label + ": task '" + id + "' does not exist");
                continue;
            }
            if (task->milestone != milestone.id) {
                issues.push_back(label + ": lists task " + id + " which belongs to milestone " + task->milestone);
            }
            if (task->is_validation()) {
                ++validation_count;
                if (i + 1 != milestone.tasks.size()) {
                    issues.push_back(label + ": validation task " + id + " is not the last task");
                }
            }

            switch (milestone.status) {
                case MilestoneStatus::NotStarted:
                    if (task->status != TaskStatus::Pending) {
                        issues.push_back(label + ": not started but task " + id + " is " + to_string(task->status));
                    }
                    break;
                case MilestoneStatus::InProgress:
                    break;
                case MilestoneStatus::Complete:
                    if (!task->is_validation() && task->status != TaskStatus::Completed) {
                        issues.push_back(label + ": complete but task " + id + " is " + to_string(task->status));
                    }
                    break;
                case MilestoneStatus::Validated:
                    if (task->status != TaskStatus::Completed) {
                        issues.push_back(label + ": validated but task " + id + " is " + to_string(task->status));
                    }
                    break;
            }
        }
        if (validation_count != 1) {
            issues.push_back(label + ": has " + std::to_string(validation_count) +
                             " validation tasks; exactly one must end the milestone");
        }

        const int max_tasks = graph.max_tasks_for(milestone);
        if (static_cast<int>(milestone.tasks.size()) > max_tasks) {
            issues.push_back(label + ": holds " + std::to_string(milestone.tasks.size()) +
                             " tasks, over its maximum of " + std::to_string(max_tasks));
        }
    }
}

void check_progress(const SprintState& state, std::vector<std::string>& issues) {
    const TaskGraph& graph = state.graph;
    const ProgressTracker& progress = state.progress;

    if (progress.sprint_id != graph.sprint_id) {
        issues.push_back("progress: sprint_id '" + progress.sprint_id + "' does not match task graph '" +
                         graph.sprint_id + "'");
    }

    const auto current = graph.milestone_index(progress.current_milestone);
    if (!current) {
        issues.push_back("progress: current_milestone '" + progress.current_milestone + "' does not exist");
        return;
    }

    for (std::size_t i = 0; i < graph.milestones.size(); ++i) {
        const Milestone& milestone = graph.milestones[i];
        if (i < *current && milestone.status != MilestoneStatus::Validated) {
            issues.push_back("milestone " + milestone.id + ": precedes current milestone " +
                             progress.current_milestone + " but is " + to_string(milestone.status));
        }
        if (i > *current && milestone.status != MilestoneStatus::NotStarted) {
            issues.push_back("milestone " + milestone.id + ": follows current milestone " +
                             progress.current_milestone + " but is " + to_string(milestone.status));
        }
    }

    const bool gate_closed = graph.milestones[*current].status == MilestoneStatus::Complete;
    if (progress.validation_pending != gate_closed) {
        issues.push_back(std::string("progress: validation_pending is ") +
                         (progress.validation_pending ? "true" : "false") + " but milestone " +
                         progress.current_milestone + " is " + to_string(graph.milestones[*current].status));
    }

    const bool all_validated = graph.milestones[*current].status == MilestoneStatus::Validated &&
                               *current + 1 == graph.milestones.size();
    if ((progress.status == SprintStatus::Completed) != all_validated) {
        issues.push_back(std::string("progress: sprint status ") + to_string(progress.status) +
                         " disagrees with milestone " + progress.current_milestone + " being " +
                         to_string(graph.milestones[*current].status));
    }

    ProgressTracker recount;
    recount.refresh_counters(graph);
    if (recount.total_tasks != progress.total_tasks || recount.completed_tasks != progress.completed_tasks) {
        issues.push_back("progress: counters " + std::to_string(progress.completed_tasks) + "/" +
                         std::to_string(progress.total_tasks) + " disagree with task graph " +
                         std::to_string(recount.completed_tasks) + "/" + std::to_string(recount.total_tasks));
    }
}

void check_config(const SprintState& state, std::vector<std::string>& issues) {
    for (const auto& pattern : state.guardrails.forbidden_patterns) {
        try {
            std::regex compiled(pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            issues.push_back("guardrails: forbidden pattern '" + pattern + "' is not a valid regex: " + e.what());
        }
    }
    std::set<std::string> deferred_ids;
    for (const auto& feature : state.deferred.features) {
        if (!deferred_ids.insert(feature.id).second) {
            issues.push_back("deferred_features: duplicate id " + feature.id);
        }
    }
}

}

std::vector<std::string> collect_invariant_issues(const SprintState& state) {
    std::vector<std::string> issues;
    if (state.graph.milestones.empty()) {
        issues.push_back("task_graph: no milestones");
    }
    check_tasks(state.graph, issues);
    check_milestones(state.graph, issues);
    if (!state.graph.milestones.empty()) {
        check_progress(state, issues);
    }
    check_config(state, issues);
    return issues;
}

std::vector<std::string> collect_warnings(const SprintState& state) {
    std::vector<std::string> warnings;
    for (const auto& milestone : state.graph.milestones) {
        const int min_tasks = state.graph.min_tasks_for(milestone);
        if (static_cast<int>(milestone.tasks.size()) < min_tasks) {
            warnings.push_back("milestone " + milestone.id + " holds " + std::to_string(milestone.tasks.size()) +
                               " tasks, under its minimum of " + std::to_string(min_tasks));
        }
    }
    return warnings;
}

void validate_state(const SprintState& state) {
    schedule::DependencyResolver::cycle_check(state.graph);
    auto issues = collect_invariant_issues(state);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            log::debug("[StateValidator] " + issue);
        }
        throw SchemaError(std::move(issues));
    }
    for (const auto& warning : collect_warnings(state)) {
        log::warn("[StateValidator] " + warning);
    }
}

}
