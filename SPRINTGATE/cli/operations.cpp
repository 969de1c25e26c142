#include "cli/operations.hpp"

#include <algorithm>
#include <utility>

#include "guard/scope_guard.hpp"
#include "model/sprint_state.hpp"
#include "planner/enhancement_planner.hpp"
#include "schedule/dependency_resolver.hpp"
#include "schedule/milestone_state_machine.hpp"
#include "store/atomic_file.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace sprintgate::cli {
namespace {

nlohmann::json task_summary(const Task& task) {
    return nlohmann::json{
        {"id", task.id},
        {"title", task.title},
        {"type", to_string(task.type)},
        {"status", to_string(task.status)},
        {"milestone", task.milestone},
    };
}

nlohmann::json findings_to_json(const std::vector<guard::ScopeFinding>& findings) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& finding : findings) {
        nlohmann::json entry{
            {"kind", guard::to_string(finding.kind)},
            {"file", finding.file},
            {"message", finding.message},
        };
        if (!finding.pattern.empty()) {
            entry["pattern"] = finding.pattern;
        }
        if (finding.line > 0) {
            entry["line"] = finding.line;
        }
        out.push_back(std::move(entry));
    }
    return out;
}

const Task& require_task(const TaskGraph& graph, const std::string& task_id) {
    const Task* task = graph.find_task(task_id);
    if (!task) {
        throw NotFound("task", task_id);
    }
    return *task;
}

// Optional config documents supplied next to the state directory survive `init`.
template <typename T, typename Parse>
T read_existing(const fs::path& path, T fallback, Parse parse) {
    auto contents = store::read_file(path);
    if (!contents) {
        return fallback;
    }
    std::vector<std::string> issues;
    nlohmann::json document = nlohmann::json::object();
    try {
        document = nlohmann::json::parse(*contents);
    } catch (const nlohmann::json::parse_error& e) {
        throw SchemaError({path.filename().string() + ": " + e.what()});
    }
    T value = parse(document, issues);
    if (!issues.empty()) {
        throw SchemaError(std::move(issues));
    }
    return value;
}

}

void OperationResult::fail(const SprintError& e) {
    fail(ErrorInfo{to_string(e.code()), e.what(), e.recoverable(), e.details()},
         e.recoverable() ? kExitBlocked : kExitFatal);
}

void OperationResult::fail(ErrorInfo info, int code) {
    ok = false;
    error = std::move(info);
    exit_code = code;
}

nlohmann::json OperationResult::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    j["ok"] = ok;
    j["operation"] = operation;
    j["result"] = result;
    if (error) {
        j["error"] = nlohmann::json{
            {"code", error->code},
            {"message", error->message},
            {"recoverable", error->recoverable},
            {"details", error->details},
        };
    }
    return j;
}

Operations::Operations(store::TaskGraphStore& store, time::Clock clock)
    : store_(store),
      clock_(clock ? std::move(clock) : time::system_clock()) {}

template <typename Body>
OperationResult Operations::run(const char* operation, Body&& body) {
    OperationResult out;
    out.operation = operation;
    try {
        body(out);
    } catch (const SprintError& e) {
        log::warn(std::string("[Operations] ") + operation + " failed: " + e.what());
        out.fail(e);
    }
    return out;
}

OperationResult Operations::init(const nlohmann::json& plan) {
    return run("init", [&](OperationResult& out) {
        std::vector<std::string> issues;
        TaskGraph graph = model::task_graph_from_json(plan, issues);
        if (!issues.empty()) {
            throw SchemaError(std::move(issues));
        }
        const auto& paths = store_.paths();
        const GuardrailConfig guardrails = read_existing(paths.guardrails(), GuardrailConfig{}, model::guardrails_from_json);
        const ApprovedStack stack = read_existing(paths.approved_stack(), ApprovedStack{}, model::approved_stack_from_json);

        const SprintState state = store_.initialize(graph, guardrails, stack);
        out.result = {
            {"sprint_id", state.graph.sprint_id},
            {"current_milestone", state.progress.current_milestone},
            {"milestones", state.graph.milestones.size()},
            {"total_tasks", state.progress.total_tasks},
            {"state_dir", paths.root.string()},
        };
    });
}

OperationResult Operations::get_current_status() {
    return run("get-current-status", [&](OperationResult& out) {
        const SprintState state = store_.load();
        const auto& progress = state.progress;
        nlohmann::json milestones = nlohmann::json::array();
        for (const auto& milestone : state.graph.milestones) {
            int done = 0;
            for (const auto& id : milestone.tasks) {
                const Task* task = state.graph.find_task(id);
                if (task && task->status == TaskStatus::Completed) {
                    ++done;
                }
            }
            milestones.push_back({
                {"id", milestone.id},
                {"title", milestone.title},
                {"status", to_string(milestone.status)},
                {"completed_tasks", done},
                {"total_tasks", milestone.tasks.size()},
            });
        }
        out.result = {
            {"sprint_id", progress.sprint_id},
            {"status", to_string(progress.status)},
            {"current_milestone", progress.current_milestone},
            {"validation_pending", progress.validation_pending},
            {"completed_tasks", progress.completed_tasks},
            {"total_tasks", progress.total_tasks},
            {"deferred_features", state.deferred.features.size()},
            {"milestones", std::move(milestones)},
        };
        if (progress.validation_pending) {
            out.exit_code = kExitBlocked;
        }
    });
}

OperationResult Operations::get_next_task(const std::optional<std::string>& task_id,
                                          const std::optional<std::string>& milestone_id) {
    return run("get-next-task", [&](OperationResult& out) {
        const SprintState state = store_.load();
        schedule::DependencyResolver resolver(state.graph);
        if (task_id) {
            const Task& task = resolver.require_startable(state.progress, *task_id);
            out.result = {{"status", "selected"}, {"task", model::to_json(task)}};
            return;
        }

        const auto selection = resolver.next_task(state.progress, milestone_id);
        out.result = {
            {"milestone", selection.milestone},
            {"reason", selection.reason},
        };
        switch (selection.outcome) {
            case schedule::SelectionOutcome::Selected:
                out.result["status"] = "selected";
                out.result["task"] = model::to_json(*selection.task);
                break;
            case schedule::SelectionOutcome::SprintComplete:
                out.result["status"] = "sprint_complete";
                break;
            case schedule::SelectionOutcome::Blocked:
            case schedule::SelectionOutcome::ValidationPending:
                out.result["status"] = "blocked";
                out.result["cause"] = schedule::to_string(selection.outcome);
                out.exit_code = kExitBlocked;
                break;
        }
    });
}

OperationResult Operations::get_task_details(const std::string& task_id) {
    return run("get-task-details", [&](OperationResult& out) {
        const SprintState state = store_.load();
        const Task& task = require_task(state.graph, task_id);
        schedule::DependencyResolver resolver(state.graph);
        out.result = model::to_json(task);
        out.result["eligible"] = resolver.is_eligible(task);
        out.result["max_file_changes"] = state.graph.max_file_changes_for(task);
        nlohmann::json dependents = nlohmann::json::array();
        for (const Task* other : state.graph.declared_sequence()) {
            const auto& deps = other->dependencies;
            if (std::find(deps.begin(), deps.end(), task.id) != deps.end()) {
                dependents.push_back(other->id);
            }
        }
        out.result["dependents"] = std::move(dependents);
    });
}

OperationResult Operations::validate_dependencies(const std::string& task_id) {
    return run("validate-dependencies", [&](OperationResult& out) {
        const SprintState state = store_.load();
        const Task& task = require_task(state.graph, task_id);
        schedule::DependencyResolver resolver(state.graph);

        nlohmann::json dependencies = nlohmann::json::array();
        for (const auto& dep : task.dependencies) {
            const Task* other = state.graph.find_task(dep);
            dependencies.push_back({{"id", dep}, {"status", other ? to_string(other->status) : "missing"}});
        }
        const auto unmet = resolver.unmet_dependencies(task);
        if (!unmet.empty()) {
            throw DependencyUnsatisfied(task.id, unmet);
        }
        out.result = {
            {"task_id", task.id},
            {"satisfied", true},
            {"dependencies", std::move(dependencies)},
        };
    });
}

OperationResult Operations::check_scope_compliance(const std::string& task_id,
                                                   const std::optional<std::vector<std::string>>& changed_files,
                                                   const std::optional<fs::path>& content_root) {
    return run("check-scope-compliance", [&](OperationResult& out) {
        const SprintState state = store_.load();
        const Task& task = require_task(state.graph, task_id);
        guard::ScopeGuard guard(state.guardrails, state.graph.scope_enforcement);

        // The report stays in the result even when an error is raised, so every finding is visible.
        std::vector<guard::ScopeFinding> findings;
        if (changed_files) {
            findings = guard.inspect(task, *changed_files, content_root);
        }
        const auto tech = guard.tech_findings(task, state.approved_stack);
        out.result = {
            {"task_id", task.id},
            {"brief", guard.pre_check(task).to_json()},
            {"findings", findings_to_json(findings)},
            {"tech_violations", tech},
            {"compliant", findings.empty() && tech.empty()},
        };
        if (!findings.empty()) {
            std::vector<std::string> messages;
            for (const auto& finding : findings) {
                messages.push_back(finding.message);
            }
            throw ScopeViolation(task.id, std::move(messages));
        }
        if (!tech.empty()) {
            throw TechNonCompliance(task.id, tech);
        }
    });
}

OperationResult Operations::start_task(const std::string& task_id) {
    return run("start-task", [&](OperationResult& out) {
        guard::ScopeBrief brief;
        const SprintState committed = store_.atomic_update([&](SprintState& state) {
            schedule::DependencyResolver resolver(state.graph);
            const Task& task = resolver.require_startable(state.progress, task_id);
            guard::ScopeGuard guard(state.guardrails, state.graph.scope_enforcement);
            guard.tech_compliance(task, state.approved_stack);
            brief = guard.pre_check(task);

            schedule::MilestoneStateMachine machine(state.graph, state.progress, clock_);
            machine.start_task(task_id);
        });
        const Task& task = require_task(committed.graph, task_id);
        out.result = {
            {"task", task_summary(task)},
            {"brief", brief.to_json()},
            {"sprint_status", to_string(committed.progress.status)},
        };
    });
}

OperationResult Operations::complete_task(const std::string& task_id,
                                          const std::optional<std::vector<std::string>>& changed_files,
                                          const std::optional<fs::path>& content_root) {
    return run("complete-task", [&](OperationResult& out) {
        bool gate_raised = false;
        const SprintState committed = store_.atomic_update([&](SprintState& state) {
            const Task& task = require_task(state.graph, task_id);
            if (changed_files) {
                guard::ScopeGuard guard(state.guardrails, state.graph.scope_enforcement);
                guard.post_check(task, *changed_files, content_root);
            }
            schedule::MilestoneStateMachine machine(state.graph, state.progress, clock_);
            gate_raised = machine.complete_task(task_id);
        });
        const Task& task = require_task(committed.graph, task_id);
        const Milestone* milestone = committed.graph.find_milestone(task.milestone);
        out.result = {
            {"task", task_summary(task)},
            {"milestone_status", milestone ? to_string(milestone->status) : "unknown"},
            {"validation_pending", committed.progress.validation_pending},
            {"completed_tasks", committed.progress.completed_tasks},
            {"total_tasks", committed.progress.total_tasks},
        };
        if (gate_raised) {
            out.result["next_step"] = "run the external validator, then record-validation " + task.milestone;
        }
    });
}

OperationResult Operations::get_milestone_status(const std::string& milestone_id) {
    return run("get-milestone-status", [&](OperationResult& out) {
        SprintState state = store_.load();
        const Milestone* milestone = state.graph.find_milestone(milestone_id);
        if (!milestone) {
            throw NotFound("milestone", milestone_id);
        }
        schedule::MilestoneStateMachine machine(state.graph, state.progress, clock_);
        nlohmann::json tasks = nlohmann::json::array();
        for (const auto& id : milestone->tasks) {
            if (const Task* task = state.graph.find_task(id)) {
                tasks.push_back(task_summary(*task));
            }
        }
        nlohmann::json validations = nlohmann::json::array();
        for (const auto& record : state.progress.validations) {
            if (record.milestone == milestone->id) {
                validations.push_back(model::to_json(record));
            }
        }
        const bool current = state.progress.current_milestone == milestone->id;
        out.result = {
            {"id", milestone->id},
            {"title", milestone->title},
            {"status", to_string(milestone->status)},
            {"current", current},
            {"validation_pending", current && state.progress.validation_pending},
            {"work_complete", machine.work_complete(*milestone)},
            {"capacity", {{"min_tasks", state.graph.min_tasks_for(*milestone)},
                          {"max_tasks", state.graph.max_tasks_for(*milestone)}}},
            {"tasks", std::move(tasks)},
            {"validations", std::move(validations)},
        };
    });
}

OperationResult Operations::request_validation(const std::string& milestone_id) {
    return run("request-validation", [&](OperationResult& out) {
        const SprintState committed = store_.atomic_update([&](SprintState& state) {
            schedule::MilestoneStateMachine machine(state.graph, state.progress, clock_);
            machine.request_validation(milestone_id);
        });
        out.result = {
            {"milestone", milestone_id},
            {"status", to_string(committed.graph.find_milestone(milestone_id)->status)},
            {"validation_pending", committed.progress.validation_pending},
        };
    });
}

OperationResult Operations::record_validation(const std::string& milestone_id,
                                              ValidationOutcome outcome,
                                              const std::vector<std::string>& issues) {
    return run("record-validation", [&](OperationResult& out) {
        const SprintState committed = store_.atomic_update([&](SprintState& state) {
            schedule::MilestoneStateMachine machine(state.graph, state.progress, clock_);
            machine.record_validation(milestone_id, outcome, issues);
        });
        out.result = {
            {"milestone", milestone_id},
            {"outcome", to_string(outcome)},
            {"milestone_status", to_string(committed.graph.find_milestone(milestone_id)->status)},
            {"current_milestone", committed.progress.current_milestone},
            {"sprint_status", to_string(committed.progress.status)},
            {"validation_pending", committed.progress.validation_pending},
        };
    });
}

OperationResult Operations::apply_enhancement(const std::string& description,
                                              const nlohmann::json& request_json,
                                              bool defer) {
    return run("apply-enhancement", [&](OperationResult& out) {
        const auto request = planner::FeatureRequest::from_json(request_json, description);
        planner::EnhancementPlanner planner(clock_);
        if (defer) {
            const DeferredFeature feature = planner.defer(store_, request, "deferred on request");
            out.result = {{"deferred", true}, {"feature", model::to_json(feature)}};
            return;
        }
        const planner::Placement placement = planner.apply(store_, request);
        out.result = placement.to_json();
        out.result["deferred"] = false;
    });
}

OperationResult Operations::list_deferred() {
    return run("list-deferred", [&](OperationResult& out) {
        const SprintState state = store_.load();
        out.result = {{"features", model::to_json(state.deferred)["features"]}};
    });
}

OperationResult Operations::list_backups() {
    return run("list-backups", [&](OperationResult& out) {
        nlohmann::json backups = nlohmann::json::array();
        for (const auto& backup : store_.backups()) {
            backups.push_back({{"timestamp", backup.timestamp}, {"files", backup.files}});
        }
        out.result = {{"backups", std::move(backups)}};
    });
}

OperationResult Operations::restore_backup(const std::string& timestamp) {
    return run("restore-backup", [&](OperationResult& out) {
        store_.restore_backup(timestamp);
        const SprintState state = store_.load();
        out.result = {
            {"restored", timestamp},
            {"current_milestone", state.progress.current_milestone},
            {"completed_tasks", state.progress.completed_tasks},
        };
    });
}

}
