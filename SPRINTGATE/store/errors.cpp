#include "store/errors.hpp"

#include <utility>

#include "utils/string_utils.hpp"

namespace sprintgate {
namespace {

std::string with_count(std::size_t count, const char* noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaError:            return "schema_error";
        case ErrorCode::CycleDetected:          return "cycle_detected";
        case ErrorCode::DependencyUnsatisfied:  return "dependency_unsatisfied";
        case ErrorCode::ValidationPendingBlock: return "validation_pending";
        case ErrorCode::ScopeViolation:         return "scope_violation";
        case ErrorCode::TechNonCompliance:      return "tech_non_compliance";
        case ErrorCode::LockContention:         return "lock_contention";
        case ErrorCode::StateCorruptionOnWrite: return "state_corruption_on_write";
        case ErrorCode::InvalidTransition:      return "invalid_transition";
        case ErrorCode::NotFound:               return "not_found";
        case ErrorCode::PlacementRejected:      return "placement_rejected";
    }
    return "unknown";
}

bool is_recoverable(ErrorCode code) {
    switch (code) {
        case ErrorCode::SchemaError:
        case ErrorCode::CycleDetected:
        case ErrorCode::StateCorruptionOnWrite:
            return false;
        case ErrorCode::DependencyUnsatisfied:
        case ErrorCode::ValidationPendingBlock:
        case ErrorCode::ScopeViolation:
        case ErrorCode::TechNonCompliance:
        case ErrorCode::LockContention:
        case ErrorCode::InvalidTransition:
        case ErrorCode::NotFound:
        case ErrorCode::PlacementRejected:
            return true;
    }
    return false;
}

SprintError::SprintError(ErrorCode code, const std::string& message, std::vector<std::string> details)
    : std::runtime_error(message),
      code_(code),
      details_(std::move(details)) {}

SchemaError::SchemaError(std::vector<std::string> issues)
    : SprintError(ErrorCode::SchemaError,
                  "state failed schema validation (" + with_count(issues.size(), "issue") + "): " +
                      strings::join(issues, "; "),
                  issues) {}

CycleDetected::CycleDetected(std::vector<std::string> cycle)
    : SprintError(ErrorCode::CycleDetected,
                  "dependency cycle detected: " + strings::join(cycle, " -> "),
                  cycle) {}

DependencyUnsatisfied::DependencyUnsatisfied(const std::string& task_id, std::vector<std::string> unmet)
    : DependencyUnsatisfied(Subject::Task, task_id, std::move(unmet)) {}

DependencyUnsatisfied::DependencyUnsatisfied(Subject subject, const std::string& id, std::vector<std::string> unmet)
    : SprintError(ErrorCode::DependencyUnsatisfied,
                  subject == Subject::Milestone
                      ? "milestone " + id + " cannot be validated; open work tasks: " + strings::join(unmet, ", ")
                      : "task " + id + " has unmet dependencies: " + strings::join(unmet, ", "),
                  unmet) {}

ValidationPendingBlock::ValidationPendingBlock(const std::string& milestone_id)
    : SprintError(ErrorCode::ValidationPendingBlock,
                  "milestone " + milestone_id + " is complete and awaiting validation; run the validator and record-validation first",
                  {milestone_id}) {}

ScopeViolation::ScopeViolation(const std::string& task_id, std::vector<std::string> violations)
    : SprintError(ErrorCode::ScopeViolation,
                  "task " + task_id + " violates its scope boundary (" + with_count(violations.size(), "violation") +
                      "): " + strings::join(violations, "; "),
                  violations) {}

TechNonCompliance::TechNonCompliance(const std::string& task_id, std::vector<std::string> violations)
    : SprintError(ErrorCode::TechNonCompliance,
                  "task " + task_id + " references technology outside the approved stack: " +
                      strings::join(violations, "; "),
                  violations) {}

LockContention::LockContention(const std::string& lock_path, const std::string& holder, long waited_ms)
    : SprintError(ErrorCode::LockContention,
                  "state lock '" + lock_path + "' still held after " + std::to_string(waited_ms) + "ms" +
                      (holder.empty() ? std::string() : " (holder: " + holder + ")"),
                  holder.empty() ? std::vector<std::string>{} : std::vector<std::string>{holder}) {}

StateCorruptionOnWrite::StateCorruptionOnWrite(const std::string& message, std::vector<std::string> details)
    : SprintError(ErrorCode::StateCorruptionOnWrite, message, std::move(details)) {}

InvalidTransition::InvalidTransition(const std::string& message)
    : SprintError(ErrorCode::InvalidTransition, message) {}

NotFound::NotFound(const std::string& kind, const std::string& id)
    : SprintError(ErrorCode::NotFound, kind + " '" + id + "' does not exist", {id}) {}

PlacementRejected::PlacementRejected(const std::string& message, std::vector<std::string> details)
    : SprintError(ErrorCode::PlacementRejected, message, std::move(details)) {}

}
