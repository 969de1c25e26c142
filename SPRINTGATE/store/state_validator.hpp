#pragma once

#include <string>
#include <vector>

#include "model/sprint_state.hpp"

namespace sprintgate::store {

// Referential and lifecycle invariants across graph, tracker and config. Every problem is listed.
std::vector<std::string> collect_invariant_issues(const SprintState& state);

// Soft findings (milestones under their minimum size) that are logged but never block.
std::vector<std::string> collect_warnings(const SprintState& state);

// Acyclicity first, so a cyclic graph always surfaces as CycleDetected; then SchemaError with all issues.
void validate_state(const SprintState& state);

}
