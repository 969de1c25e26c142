#include "schedule/milestone_state_machine.hpp"

#include <utility>

#include "store/errors.hpp"
#include "utils/log.hpp"

namespace sprintgate::schedule {

MilestoneStateMachine::MilestoneStateMachine(TaskGraph& graph, ProgressTracker& progress, time::Clock clock)
    : graph_(graph),
      progress_(progress),
      clock_(clock ? std::move(clock) : time::system_clock()) {}

bool MilestoneStateMachine::can_transition(MilestoneStatus from, MilestoneStatus to) {
    switch (from) {
        case MilestoneStatus::NotStarted:
            return to == MilestoneStatus::InProgress;
        case MilestoneStatus::InProgress:
            return to == MilestoneStatus::Complete;
        case MilestoneStatus::Complete:
            return to == MilestoneStatus::Validated || to == MilestoneStatus::InProgress;
        case MilestoneStatus::Validated:
            return false;
    }
    return false;
}

Milestone& MilestoneStateMachine::require_milestone(const std::string& milestone_id) {
    Milestone* milestone = graph_.find_milestone(milestone_id);
    if (!milestone) {
        throw NotFound("milestone", milestone_id);
    }
    return *milestone;
}

void MilestoneStateMachine::transition(Milestone& milestone, MilestoneStatus to, const std::string& detail) {
    const MilestoneStatus from = milestone.status;
    if (!can_transition(from, to)) {
        throw InvalidTransition("milestone " + milestone.id + " cannot move from " + sprintgate::to_string(from) +
                                " to " + sprintgate::to_string(to));
    }
    milestone.status = to;
    progress_.append_history(clock_(), std::string("milestone_") + sprintgate::to_string(to), milestone.id, detail);
    log::info("[MilestoneStateMachine] " + milestone.id + ": " + sprintgate::to_string(from) + " -> " + sprintgate::to_string(to));
}

bool MilestoneStateMachine::work_complete(const Milestone& milestone) const {
    for (const auto& id : milestone.tasks) {
        const Task* task = graph_.find_task(id);
        if (task && !task->is_validation() && task->status != TaskStatus::Completed) {
            return false;
        }
    }
    return true;
}

void MilestoneStateMachine::start_task(const std::string& task_id) {
    Task* task = graph_.find_task(task_id);
    if (!task) {
        throw NotFound("task", task_id);
    }
    if (task->status != TaskStatus::Pending) {
        throw InvalidTransition("task " + task_id + " is " + sprintgate::to_string(task->status) + ", not pending");
    }
    Milestone& milestone = require_milestone(task->milestone);
    if (!milestone.is_open()) {
        throw InvalidTransition("milestone " + milestone.id + " is " + sprintgate::to_string(milestone.status) +
                                "; its tasks cannot start");
    }

    task->status = TaskStatus::InProgress;
    progress_.append_history(clock_(), "task_started", task_id);
    if (milestone.status == MilestoneStatus::NotStarted) {
        transition(milestone, MilestoneStatus::InProgress, "first task " + task_id + " started");
    }
    if (progress_.status == SprintStatus::Planned) {
        progress_.status = SprintStatus::InProgress;
    }
    progress_.refresh_counters(graph_);
}

bool MilestoneStateMachine::complete_task(const std::string& task_id) {
    Task* task = graph_.find_task(task_id);
    if (!task) {
        throw NotFound("task", task_id);
    }
    if (task->status != TaskStatus::InProgress) {
        throw InvalidTransition("task " + task_id + " is " + sprintgate::to_string(task->status) +
                                "; only in-progress tasks can complete");
    }
    Milestone& milestone = require_milestone(task->milestone);

    task->status = TaskStatus::Completed;
    progress_.append_history(clock_(), "task_completed", task_id);
    progress_.refresh_counters(graph_);

    if (milestone.status == MilestoneStatus::InProgress && work_complete(milestone)) {
        transition(milestone, MilestoneStatus::Complete, "all work tasks completed");
        progress_.validation_pending = true;
        return true;
    }
    return false;
}

void MilestoneStateMachine::request_validation(const std::string& milestone_id) {
    Milestone& milestone = require_milestone(milestone_id);
    if (milestone.status != MilestoneStatus::InProgress && milestone.status != MilestoneStatus::NotStarted) {
        throw InvalidTransition("milestone " + milestone_id + " is " + sprintgate::to_string(milestone.status) +
                                "; only an open milestone can request validation");
    }
    if (milestone_id != progress_.current_milestone) {
        throw InvalidTransition("milestone " + milestone_id + " is not the current milestone (" +
                                progress_.current_milestone + ")");
    }
    if (!work_complete(milestone)) {
        std::vector<std::string> open;
        for (const auto& id : milestone.tasks) {
            const Task* task = graph_.find_task(id);
            if (task && !task->is_validation() && task->status != TaskStatus::Completed) {
                open.push_back(id);
            }
        }
        throw DependencyUnsatisfied(DependencyUnsatisfied::Subject::Milestone, milestone_id, open);
    }
    if (milestone.status == MilestoneStatus::NotStarted) {
        transition(milestone, MilestoneStatus::InProgress, "no work tasks to start");
    }
    transition(milestone, MilestoneStatus::Complete, "validation requested");
    progress_.validation_pending = true;
}

void MilestoneStateMachine::record_validation(const std::string& milestone_id,
                                              ValidationOutcome outcome,
                                              std::vector<std::string> issues) {
    Milestone& milestone = require_milestone(milestone_id);
    if (milestone.status != MilestoneStatus::Complete) {
        throw InvalidTransition("milestone " + milestone_id + " is " + sprintgate::to_string(milestone.status) +
                                "; validation results apply only to a complete milestone");
    }

    ValidationRecord record;
    record.milestone = milestone_id;
    record.timestamp = clock_();
    record.status = outcome;
    record.issues = std::move(issues);
    const std::size_t issue_count = record.issues.size();
    progress_.validations.push_back(std::move(record));
    progress_.validation_pending = false;

    if (outcome == ValidationOutcome::Passed) {
        for (const auto& id : milestone.tasks) {
            Task* task = graph_.find_task(id);
            if (task && task->is_validation()) {
                task->status = TaskStatus::Completed;
            }
        }
        transition(milestone, MilestoneStatus::Validated, "validator reported passed");
        advance_current_milestone(milestone);
    } else {
        transition(milestone, MilestoneStatus::InProgress,
                   "validator reported " + std::to_string(issue_count) + " issue(s); reopened for remediation");
    }
    progress_.refresh_counters(graph_);
}

void MilestoneStateMachine::advance_current_milestone(const Milestone& validated) {
    const auto index = graph_.milestone_index(validated.id);
    for (std::size_t i = index ? *index + 1 : 0; i < graph_.milestones.size(); ++i) {
        if (graph_.milestones[i].status != MilestoneStatus::Validated) {
            progress_.current_milestone = graph_.milestones[i].id;
            log::info("[MilestoneStateMachine] Current milestone is now " + progress_.current_milestone);
            return;
        }
    }
    progress_.status = SprintStatus::Completed;
    progress_.append_history(clock_(), "sprint_completed", progress_.sprint_id);
    log::info("[MilestoneStateMachine] Every milestone validated; sprint " + progress_.sprint_id + " complete");
}

}
