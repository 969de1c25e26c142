#include "doctest/doctest.h"

#include <string>
#include <vector>

#include "schedule/dependency_resolver.hpp"
#include "schedule/milestone_state_machine.hpp"
#include "store/errors.hpp"
#include "store/state_validator.hpp"
#include "test_support.hpp"

using namespace sprintgate;
using schedule::DependencyResolver;
using schedule::MilestoneStateMachine;
using schedule::SelectionOutcome;
using testing::GraphBuilder;

namespace {

struct Sprint {
    SprintState state;

    explicit Sprint(const GraphBuilder& builder) {
        state.graph = builder.build();
        state.progress.sprint_id = state.graph.sprint_id;
        state.progress.current_milestone = state.graph.milestones.front().id;
        state.progress.refresh_counters(state.graph);
    }

    MilestoneStateMachine machine() { return MilestoneStateMachine(state.graph, state.progress, testing::stepping_clock()); }

    void finish(const std::string& task_id) {
        auto m = machine();
        m.start_task(task_id);
        m.complete_task(task_id);
    }

    MilestoneStatus status(const std::string& milestone_id) const {
        return state.graph.find_milestone(milestone_id)->status;
    }
};

GraphBuilder four_plus_validation() {
    GraphBuilder builder;
    builder.milestone("M1", {{"T1", {}}, {"T2", {}}, {"T3", {"T1"}}, {"T4", {}}})
        .milestone("M2", {{"U1", {}}, {"U2", {"U1"}}});
    return builder;
}

}

TEST_CASE("transition table allows only the documented edges") {
    using S = MilestoneStatus;
    CHECK(MilestoneStateMachine::can_transition(S::NotStarted, S::InProgress));
    CHECK(MilestoneStateMachine::can_transition(S::InProgress, S::Complete));
    CHECK(MilestoneStateMachine::can_transition(S::Complete, S::Validated));
    CHECK(MilestoneStateMachine::can_transition(S::Complete, S::InProgress));
    CHECK_FALSE(MilestoneStateMachine::can_transition(S::NotStarted, S::Complete));
    CHECK_FALSE(MilestoneStateMachine::can_transition(S::InProgress, S::Validated));
    CHECK_FALSE(MilestoneStateMachine::can_transition(S::Validated, S::InProgress));
    CHECK_FALSE(MilestoneStateMachine::can_transition(S::Validated, S::Complete));
}

TEST_CASE("completing all four work tasks raises the gate and blocks the next milestone") {
    Sprint sprint(four_plus_validation());
    auto& progress = sprint.state.progress;

    sprint.finish("T1");
    CHECK(sprint.status("M1") == MilestoneStatus::InProgress);
    CHECK(progress.status == SprintStatus::InProgress);
    sprint.finish("T2");
    sprint.finish("T3");
    CHECK_FALSE(progress.validation_pending);

    auto machine = sprint.machine();
    machine.start_task("T4");
    CHECK(machine.complete_task("T4"));

    CHECK(progress.validation_pending);
    CHECK(progress.current_milestone == "M1");
    CHECK(sprint.status("M1") == MilestoneStatus::Complete);
    CHECK(store::collect_invariant_issues(sprint.state).empty());

    DependencyResolver resolver(sprint.state.graph);
    // U1 has no dependencies at all, yet the gate holds it back.
    CHECK(resolver.is_eligible(*sprint.state.graph.find_task("U1")));
    const auto selection = resolver.next_task(progress);
    CHECK(selection.outcome != SelectionOutcome::Selected);
    CHECK(selection.outcome == SelectionOutcome::ValidationPending);
    CHECK(selection.task == nullptr);
    CHECK(resolver.next_task(progress, std::string("M2")).outcome == SelectionOutcome::ValidationPending);
    CHECK_THROWS_AS(resolver.require_startable(progress, "U1"), ValidationPendingBlock);
}

TEST_CASE("passed validation closes the milestone and advances to the next") {
    Sprint sprint(four_plus_validation());
    for (const char* id : {"T1", "T2", "T3", "T4"}) {
        sprint.finish(id);
    }
    auto machine = sprint.machine();
    machine.record_validation("M1", ValidationOutcome::Passed, {});

    auto& progress = sprint.state.progress;
    CHECK(sprint.status("M1") == MilestoneStatus::Validated);
    CHECK(sprint.state.graph.find_task("M1-V")->status == TaskStatus::Completed);
    CHECK_FALSE(progress.validation_pending);
    CHECK(progress.current_milestone == "M2");
    REQUIRE(progress.validations.size() == 1);
    CHECK(progress.validations[0].status == ValidationOutcome::Passed);
    CHECK(store::collect_invariant_issues(sprint.state).empty());

    DependencyResolver resolver(sprint.state.graph);
    const auto selection = resolver.next_task(progress);
    REQUIRE(selection.outcome == SelectionOutcome::Selected);
    CHECK(selection.task->id == "U1");

    // Validated is terminal.
    CHECK_THROWS_AS(machine.record_validation("M1", ValidationOutcome::Failed, {"late"}), InvalidTransition);
}

TEST_CASE("failed validation reopens the milestone until validation is requested again") {
    Sprint sprint(four_plus_validation());
    for (const char* id : {"T1", "T2", "T3", "T4"}) {
        sprint.finish(id);
    }
    auto machine = sprint.machine();
    machine.record_validation("M1", ValidationOutcome::Failed, {"lint: 3 warnings", "test_io failed"});

    auto& progress = sprint.state.progress;
    CHECK(sprint.status("M1") == MilestoneStatus::InProgress);
    CHECK_FALSE(progress.validation_pending);
    CHECK(progress.current_milestone == "M1");
    REQUIRE(progress.validations.size() == 1);
    CHECK(progress.validations[0].issues.size() == 2);
    CHECK(store::collect_invariant_issues(sprint.state).empty());

    CHECK_THROWS_AS(machine.record_validation("M1", ValidationOutcome::Passed, {}), InvalidTransition);
    CHECK_THROWS_AS(machine.request_validation("M2"), InvalidTransition);

    machine.request_validation("M1");
    CHECK(progress.validation_pending);
    machine.record_validation("M1", ValidationOutcome::Passed, {});
    CHECK(progress.current_milestone == "M2");
    CHECK(progress.validations.size() == 2);
}

TEST_CASE("request_validation names the work still open") {
    Sprint sprint(four_plus_validation());
    sprint.finish("T1");
    auto machine = sprint.machine();
    try {
        machine.request_validation("M1");
        FAIL("gate raised with open work");
    } catch (const DependencyUnsatisfied& e) {
        CHECK(e.details() == std::vector<std::string>{"T2", "T3", "T4"});
        const std::string message = e.what();
        CHECK(message.find("milestone M1 cannot be validated") != std::string::npos);
        CHECK(message.find("task M1") == std::string::npos);
    }
}

TEST_CASE("validating the last milestone completes the sprint") {
    GraphBuilder builder;
    builder.milestone("M1", {{"A", {}}});
    Sprint sprint(builder);
    sprint.finish("A");
    sprint.machine().record_validation("M1", ValidationOutcome::Passed, {});

    CHECK(sprint.state.progress.status == SprintStatus::Completed);
    CHECK(sprint.state.progress.history.back().event == "sprint_completed");
    CHECK(store::collect_invariant_issues(sprint.state).empty());
    DependencyResolver resolver(sprint.state.graph);
    CHECK(resolver.next_task(sprint.state.progress).outcome == SelectionOutcome::SprintComplete);
}

TEST_CASE("task transitions reject out-of-order moves") {
    Sprint sprint(four_plus_validation());
    auto machine = sprint.machine();
    CHECK_THROWS_AS(machine.complete_task("T1"), InvalidTransition);
    machine.start_task("T1");
    CHECK_THROWS_AS(machine.start_task("T1"), InvalidTransition);
    CHECK_FALSE(machine.complete_task("T1"));
    CHECK_THROWS_AS(machine.complete_task("T1"), InvalidTransition);
    CHECK_THROWS_AS(machine.start_task("GHOST"), NotFound);
}
