#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sprintgate {

enum class ErrorCode {
    SchemaError,
    CycleDetected,
    DependencyUnsatisfied,
    ValidationPendingBlock,
    ScopeViolation,
    TechNonCompliance,
    LockContention,
    StateCorruptionOnWrite,
    InvalidTransition,
    NotFound,
    PlacementRejected,
};

const char* to_string(ErrorCode code);

// Fatal codes need a manual fix or a restore; the rest can be retried once the caller acts.
bool is_recoverable(ErrorCode code);

class SprintError : public std::runtime_error {
public:
    SprintError(ErrorCode code, const std::string& message, std::vector<std::string> details = {});

    ErrorCode code() const { return code_; }
    bool recoverable() const { return is_recoverable(code_); }
    const std::vector<std::string>& details() const { return details_; }

private:
    ErrorCode code_;
    std::vector<std::string> details_;
};

class SchemaError : public SprintError {
public:
    explicit SchemaError(std::vector<std::string> issues);
};

class CycleDetected : public SprintError {
public:
    explicit CycleDetected(std::vector<std::string> cycle);
    const std::vector<std::string>& cycle() const { return details(); }
};

class DependencyUnsatisfied : public SprintError {
public:
    enum class Subject { Task, Milestone };

    DependencyUnsatisfied(const std::string& task_id, std::vector<std::string> unmet);
    // For a milestone, `unmet` lists its work tasks that are still open.
    DependencyUnsatisfied(Subject subject, const std::string& id, std::vector<std::string> unmet);
};

class ValidationPendingBlock : public SprintError {
public:
    explicit ValidationPendingBlock(const std::string& milestone_id);
};

class ScopeViolation : public SprintError {
public:
    ScopeViolation(const std::string& task_id, std::vector<std::string> violations);
};

class TechNonCompliance : public SprintError {
public:
    TechNonCompliance(const std::string& task_id, std::vector<std::string> violations);
};

class LockContention : public SprintError {
public:
    LockContention(const std::string& lock_path, const std::string& holder, long waited_ms);
};

class StateCorruptionOnWrite : public SprintError {
public:
    StateCorruptionOnWrite(const std::string& message, std::vector<std::string> details = {});
};

class InvalidTransition : public SprintError {
public:
    explicit InvalidTransition(const std::string& message);
};

class NotFound : public SprintError {
public:
    NotFound(const std::string& kind, const std::string& id);
};

class PlacementRejected : public SprintError {
public:
    PlacementRejected(const std::string& message, std::vector<std::string> details = {});
};

}
