#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/sprint_state.hpp"
#include "store/task_graph_store.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::planner {

struct FeatureRequest {
    std::string description;
    // Only id (optional), title, dependencies, scope and technologies are meaningful here.
    std::vector<Task> tasks;
    // Existing pending tasks that must wait for the new feature.
    std::vector<std::string> blocks;

    // {"description"?, "tasks": [...], "blocks"?: [...]}. A non-empty `description` argument wins over the
    // document's. Throws SchemaError listing every problem.
    static FeatureRequest from_json(const nlohmann::json& j, const std::string& description);
};

struct Placement {
    std::string enhancement_id;
    std::string milestone_id;
    std::size_t milestone_position = 0;
    bool new_milestone = false;
    std::string reason;
    // Fully populated tasks ready for insertion, in request order.
    std::vector<Task> tasks;
    // Set when new_milestone; holds the synthesized milestone and its validation task.
    std::optional<Milestone> milestone;
    std::optional<Task> validation_task;

    nlohmann::json to_json() const;
};

class EnhancementPlanner {
public:
    explicit EnhancementPlanner(time::Clock clock = time::system_clock());

    // Earliest open milestone, at or after the current one and every external dependency's milestone,
    // with room for all feature tasks. Otherwise a new milestone right after the last one the feature
    // depends on, provided that still precedes every milestone holding a blocked task.
    // Pure: throws PlacementRejected without touching `state`.
    Placement placement(const FeatureRequest& request, const SprintState& state) const;

    // Inserts the placed tasks ahead of the milestone's trailing validation task.
    void insert(const Placement& placement, const FeatureRequest& request, SprintState& state) const;

    // placement + insert inside one TaskGraphStore::atomic_update; any invariant failure rejects
    // the whole change with no file modified.
    Placement apply(store::TaskGraphStore& store, const FeatureRequest& request) const;

    // Records the feature in deferred_features.json instead of the graph.
    DeferredFeature defer(store::TaskGraphStore& store, const FeatureRequest& request, const std::string& reason) const;

private:
    std::string next_enhancement_id(const SprintState& state) const;
    void reject_cycles(const Placement& placement, const FeatureRequest& request, const SprintState& state) const;

    time::Clock clock_;
};

}
