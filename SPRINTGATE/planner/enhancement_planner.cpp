#include "planner/enhancement_planner.hpp"

#include <algorithm>
#include <cstdio>
#include <regex>
#include <set>
#include <utility>

#include "model/json_fields.hpp"
#include "schedule/dependency_resolver.hpp"
#include "store/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace sprintgate::planner {
namespace {

int numeric_suffix(const std::string& id, const std::regex& pattern) {
    std::smatch match;
    if (std::regex_match(id, match, pattern)) {
        return std::stoi(match[1].str());
    }
    return 0;
}

std::string next_milestone_id(const TaskGraph& graph) {
    static const std::regex pattern(R"(M(\d{1,6}))");
    int highest = 0;
    for (const auto& milestone : graph.milestones) {
        highest = std::max(highest, numeric_suffix(milestone.id, pattern));
    }
    std::string id = "M" + std::to_string(highest + 1);
    for (int n = highest + 2; graph.find_milestone(id); ++n) {
        id = "M" + std::to_string(n);
    }
    return id;
}

}

FeatureRequest FeatureRequest::from_json(const nlohmann::json& j, const std::string& description) {
    FeatureRequest request;
    request.description = description;
    std::vector<std::string> issues;
    model::FieldReader reader(j, "enhancement", issues, {"description", "tasks", "blocks"});
    if (request.description.empty()) {
        request.description = reader.string("description", false);
    }
    request.blocks = reader.string_list("blocks", false);
    if (const auto* tasks = reader.array("tasks", true)) {
        if (tasks->empty()) {
            issues.push_back("enhancement.tasks: must list at least one task");
        }
        for (std::size_t i = 0; i < tasks->size(); ++i) {
            model::FieldReader task_reader((*tasks)[i], reader.path("tasks", i), issues,
                                           {"id", "title", "dependencies", "scope", "technologies"});
            Task task;
            task.id = task_reader.string("id", false);
            task.title = task_reader.string("title", true);
            task.dependencies = task_reader.string_list("dependencies", false);
            task.technologies = task_reader.string_map("technologies");
            if (const auto* scope = task_reader.object("scope", false)) {
                task.scope = model::scope_from_json(*scope, task_reader.path("scope"), issues);
            }
            request.tasks.push_back(std::move(task));
        }
    }
    if (strings::trim_copy(request.description).empty()) {
        issues.push_back("enhancement.description: must not be empty");
    }
    if (!issues.empty()) {
        throw SchemaError(std::move(issues));
    }
    return request;
}

nlohmann::json Placement::to_json() const {
    nlohmann::json j = nlohmann::json::object();
    j["enhancement_id"] = enhancement_id;
    j["milestone"] = milestone_id;
    j["milestone_position"] = milestone_position;
    j["new_milestone"] = new_milestone;
    j["reason"] = reason;
    j["tasks"] = nlohmann::json::array();
    for (const auto& task : tasks) {
        j["tasks"].push_back(task.id);
    }
    if (validation_task) {
        j["validation_task"] = validation_task->id;
    }
    return j;
}

EnhancementPlanner::EnhancementPlanner(time::Clock clock)
    : clock_(clock ? std::move(clock) : time::system_clock()) {}

std::string EnhancementPlanner::next_enhancement_id(const SprintState& state) const {
    static const std::regex pattern(R"(ENH-(\d{1,6}))");
    int highest = 0;
    for (const auto& task : state.graph.tasks) {
        if (task.enhancement) {
            highest = std::max(highest, numeric_suffix(task.enhancement->id, pattern));
        }
    }
    for (const auto& feature : state.deferred.features) {
        highest = std::max(highest, numeric_suffix(feature.id, pattern));
    }
    char buf[16] = {0};
    std::snprintf(buf, sizeof(buf), "ENH-%03d", highest + 1);
    return std::string(buf);
}

Placement EnhancementPlanner::placement(const FeatureRequest& request, const SprintState& state) const {
    const TaskGraph& graph = state.graph;
    if (request.tasks.empty()) {
        throw PlacementRejected("enhancement has no tasks");
    }
    if (graph.milestones.empty()) {
        throw PlacementRejected("task graph has no milestones to place into");
    }
    if (state.progress.status == SprintStatus::Completed) {
        throw PlacementRejected("sprint " + graph.sprint_id + " is already completed; defer the feature instead");
    }

    Placement result;
    result.enhancement_id = next_enhancement_id(state);
    const std::string added_at = clock_();

    std::set<std::string> feature_ids;
    std::vector<std::string> problems;
    for (std::size_t i = 0; i < request.tasks.size(); ++i) {
        Task task = request.tasks[i];
        if (task.id.empty()) {
            task.id = result.enhancement_id + "-T" + std::to_string(i + 1);
        }
        if (graph.find_task(task.id) || !feature_ids.insert(task.id).second) {
            problems.push_back("task id " + task.id + " is already taken");
        }
        task.type = TaskType::Implementation;
        task.status = TaskStatus::Pending;
        task.enhancement = EnhancementInfo{result.enhancement_id, request.description, added_at};
        result.tasks.push_back(std::move(task));
    }

    const auto current = graph.milestone_index(state.progress.current_milestone).value_or(0);
    std::size_t lower = current;
    for (const auto& task : result.tasks) {
        for (const auto& dep : task.dependencies) {
            if (feature_ids.count(dep)) {
                continue;
            }
            const Task* existing = graph.find_task(dep);
            if (!existing) {
                problems.push_back("task " + task.id + " depends on unknown task " + dep);
                continue;
            }
            if (existing->is_validation()) {
                problems.push_back("task " + task.id + " depends on validation task " + dep);
                continue;
            }
            if (auto index = graph.milestone_index(existing->milestone)) {
                lower = std::max(lower, *index);
            }
        }
    }

    std::size_t upper = graph.milestones.size() - 1;
    bool has_blocker = false;
    for (const auto& blocked_id : request.blocks) {
        const Task* blocked = graph.find_task(blocked_id);
        if (!blocked) {
            problems.push_back("blocked task " + blocked_id + " does not exist");
            continue;
        }
        if (blocked->status != TaskStatus::Pending || blocked->is_validation()) {
            problems.push_back("blocked task " + blocked_id + " is " + sprintgate::to_string(blocked->status) +
                               (blocked->is_validation() ? " validation work" : "") + " and cannot gain dependencies");
            continue;
        }
        if (auto index = graph.milestone_index(blocked->milestone)) {
            upper = has_blocker ? std::min(upper, *index) : *index;
            has_blocker = true;
        }
    }
    if (!problems.empty()) {
        throw PlacementRejected("enhancement " + result.enhancement_id + " cannot be placed", problems);
    }

    const std::size_t count = result.tasks.size();
    for (std::size_t i = lower; i <= upper && i < graph.milestones.size(); ++i) {
        const Milestone& candidate = graph.milestones[i];
        if (!candidate.is_open()) {
            continue;
        }
        const std::size_t capacity = static_cast<std::size_t>(graph.max_tasks_for(candidate));
        if (candidate.tasks.size() + count <= capacity) {
            result.milestone_id = candidate.id;
            result.milestone_position = i;
            result.reason = "milestone " + candidate.id + " satisfies every dependency and has room (" +
                            std::to_string(candidate.tasks.size()) + " + " + std::to_string(count) + " <= " +
                            std::to_string(capacity) + ")";
            for (auto& task : result.tasks) {
                task.milestone = candidate.id;
            }
            reject_cycles(result, request, state);
            return result;
        }
    }

    // Nothing fits: a new milestone goes right after the later of the current milestone and the last
    // dependency-satisfying one.
    const std::size_t position = lower + 1;
    if (has_blocker && position > upper) {
        throw PlacementRejected("enhancement " + result.enhancement_id + " needs a new milestone after " +
                                    graph.milestones[lower].id + " but blocked work sits in " +
                                    graph.milestones[upper].id,
                                {"no open milestone between " + graph.milestones[lower].id + " and " +
                                 graph.milestones[upper].id + " has room for " + std::to_string(count) + " task(s)"});
    }
    const int strategy_max = graph.milestone_strategy.max_tasks;
    if (static_cast<int>(count) + 1 > strategy_max) {
        throw PlacementRejected("enhancement " + result.enhancement_id + " has " + std::to_string(count) +
                                " tasks; a milestone holds at most " + std::to_string(strategy_max) +
                                " including its validation task");
    }

    Milestone milestone;
    milestone.id = next_milestone_id(graph);
    milestone.title = "Enhancement " + result.enhancement_id + ": " + request.description;
    milestone.status = MilestoneStatus::NotStarted;

    Task validation;
    validation.id = milestone.id + "-VALIDATE";
    validation.title = "Validate milestone " + milestone.id;
    validation.type = TaskType::Validation;
    validation.status = TaskStatus::Pending;
    validation.milestone = milestone.id;
    validation.enhancement = EnhancementInfo{result.enhancement_id, request.description, added_at};

    for (auto& task : result.tasks) {
        task.milestone = milestone.id;
        milestone.tasks.push_back(task.id);
        validation.dependencies.push_back(task.id);
    }
    milestone.tasks.push_back(validation.id);

    result.milestone_id = milestone.id;
    result.milestone_position = position;
    result.new_milestone = true;
    result.reason = "no open milestone from " + graph.milestones[lower].id + " onward has room for " +
                    std::to_string(count) + " task(s); created " + milestone.id + " after " +
                    graph.milestones[lower].id;
    result.milestone = std::move(milestone);
    result.validation_task = std::move(validation);
    reject_cycles(result, request, state);
    return result;
}

void EnhancementPlanner::insert(const Placement& placement, const FeatureRequest& request, SprintState& state) const {
    TaskGraph& graph = state.graph;
    std::vector<std::string> new_ids;
    for (const auto& task : placement.tasks) {
        new_ids.push_back(task.id);
        graph.tasks.push_back(task);
    }

    if (placement.new_milestone) {
        graph.tasks.push_back(*placement.validation_task);
        const auto at = graph.milestones.begin() +
                        static_cast<std::ptrdiff_t>(std::min(placement.milestone_position, graph.milestones.size()));
        graph.milestones.insert(at, *placement.milestone);
    } else {
        Milestone* milestone = graph.find_milestone(placement.milestone_id);
        if (!milestone) {
            throw NotFound("milestone", placement.milestone_id);
        }
        // Ahead of the trailing validation task.
        auto at = milestone->tasks.empty() ? milestone->tasks.end() : milestone->tasks.end() - 1;
        milestone->tasks.insert(at, new_ids.begin(), new_ids.end());
    }

    for (const auto& blocked_id : request.blocks) {
        if (Task* blocked = graph.find_task(blocked_id)) {
            for (const auto& id : new_ids) {
                if (std::find(blocked->dependencies.begin(), blocked->dependencies.end(), id) == blocked->dependencies.end()) {
                    blocked->dependencies.push_back(id);
                }
            }
        }
    }
}

void EnhancementPlanner::reject_cycles(const Placement& placement,
                                       const FeatureRequest& request,
                                       const SprintState& state) const {
    SprintState trial = state;
    insert(placement, request, trial);
    if (auto cycle = schedule::DependencyResolver::find_cycle(trial.graph)) {
        throw PlacementRejected("enhancement " + placement.enhancement_id + " would create a dependency cycle",
                                *cycle);
    }
}

Placement EnhancementPlanner::apply(store::TaskGraphStore& store, const FeatureRequest& request) const {
    Placement applied;
    store.atomic_update([&](SprintState& state) {
        applied = placement(request, state);
        insert(applied, request, state);
        state.progress.append_history(clock_(), "enhancement_applied", applied.enhancement_id,
                                      std::to_string(applied.tasks.size()) + " task(s) into " + applied.milestone_id +
                                          (applied.new_milestone ? " (new milestone)" : ""));
    });
    log::info("[EnhancementPlanner] " + applied.enhancement_id + " placed in " + applied.milestone_id + ": " + applied.reason);
    return applied;
}

DeferredFeature EnhancementPlanner::defer(store::TaskGraphStore& store,
                                          const FeatureRequest& request,
                                          const std::string& reason) const {
    DeferredFeature feature;
    store.atomic_update([&](SprintState& state) {
        feature.id = next_enhancement_id(state);
        feature.description = request.description;
        feature.deferred_at = clock_();
        feature.reason = reason;
        feature.tasks = nlohmann::json::array();
        for (const auto& task : request.tasks) {
            nlohmann::json entry = nlohmann::json::object();
            if (!task.id.empty()) {
                entry["id"] = task.id;
            }
            entry["title"] = task.title;
            entry["dependencies"] = task.dependencies;
            entry["scope"] = model::to_json(task.scope);
            if (!task.technologies.empty()) {
                entry["technologies"] = task.technologies;
            }
            feature.tasks.push_back(std::move(entry));
        }
        state.deferred.features.push_back(feature);
        state.progress.append_history(feature.deferred_at, "feature_deferred", feature.id, reason);
    });
    log::info("[EnhancementPlanner] Deferred " + feature.id + ": " + request.description);
    return feature;
}

}
