#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/progress.hpp"
#include "model/task_graph.hpp"

namespace sprintgate::schedule {

enum class SelectionOutcome {
    Selected,
    // Nothing runnable in the milestone being worked; reason says which tasks wait on what.
    Blocked,
    // The current milestone is complete and the human validation gate is closed.
    ValidationPending,
    SprintComplete,
};

const char* to_string(SelectionOutcome outcome);

struct Selection {
    SelectionOutcome outcome = SelectionOutcome::Blocked;
    const Task* task = nullptr;
    std::string milestone;
    std::string reason;
};

class DependencyResolver {
public:
    explicit DependencyResolver(const TaskGraph& graph);

    // Pending, and every dependency is completed.
    bool is_eligible(const Task& task) const;
    std::vector<std::string> unmet_dependencies(const Task& task) const;

    // Eligible work tasks in declared sequence. Validation tasks are closed by the validator, never scheduled.
    std::vector<const Task*> eligible_tasks() const;

    // Picks the first eligible task, in declared sequence, of the preferred milestone (the tracker's
    // current milestone when unset). Milestones after the current one are never offered.
    Selection next_task(const ProgressTracker& progress,
                        const std::optional<std::string>& preferred_milestone = std::nullopt) const;

    // Checks that an explicitly requested task may start now; throws NotFound, ValidationPendingBlock,
    // InvalidTransition or DependencyUnsatisfied naming the exact blocker.
    const Task& require_startable(const ProgressTracker& progress, const std::string& task_id) const;

    // Members of the first cycle found, closed (first id repeated at the end), or nullopt.
    static std::optional<std::vector<std::string>> find_cycle(const TaskGraph& graph);

    // Throws CycleDetected naming the cycle members.
    static void cycle_check(const TaskGraph& graph);

private:
    const TaskGraph& graph_;
};

}
