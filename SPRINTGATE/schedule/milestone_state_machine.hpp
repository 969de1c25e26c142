#pragma once

#include <string>
#include <vector>

#include "model/progress.hpp"
#include "model/task_graph.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::schedule {

// Drives milestone lifecycle over a loaded graph and tracker:
//   NOT_STARTED -> IN_PROGRESS -> COMPLETE -> VALIDATED
//   COMPLETE -> IN_PROGRESS when the validator reports a failure.
// Every transition is appended to the tracker history.
class MilestoneStateMachine {
public:
    MilestoneStateMachine(TaskGraph& graph, ProgressTracker& progress, time::Clock clock = time::system_clock());

    static bool can_transition(MilestoneStatus from, MilestoneStatus to);

    // Marks the task in progress and opens its milestone when it is the first to start.
    void start_task(const std::string& task_id);

    // Marks the task completed. Returns true when this closed the milestone's last work task,
    // which raises the validation gate.
    bool complete_task(const std::string& task_id);

    // Raises the gate for an open milestone whose work tasks are all completed
    // (after a failed validation, once remediation is done).
    void request_validation(const std::string& milestone_id);

    // Applies the external validator's report and appends the ValidationRecord.
    void record_validation(const std::string& milestone_id,
                           ValidationOutcome outcome,
                           std::vector<std::string> issues);

    bool work_complete(const Milestone& milestone) const;

private:
    Milestone& require_milestone(const std::string& milestone_id);
    void transition(Milestone& milestone, MilestoneStatus to, const std::string& detail = {});
    void advance_current_milestone(const Milestone& validated);

    TaskGraph& graph_;
    ProgressTracker& progress_;
    time::Clock clock_;
};

}
