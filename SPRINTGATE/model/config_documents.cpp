#include "model/config_documents.hpp"

#include <utility>

#include "model/json_fields.hpp"

namespace sprintgate {

std::vector<std::string> GuardrailConfig::default_forbidden_patterns() {
    return {
        R"([0-9]-(alpha|beta|rc|pre|preview|dev)([.-]?[0-9]+)?\b)",
        R"(-SNAPSHOT\b)",
        R"(@(next|canary|nightly)\b)",
    };
}

namespace model {

GuardrailConfig guardrails_from_json(const nlohmann::json& j, std::vector<std::string>& issues) {
    GuardrailConfig config;
    FieldReader reader(j, "guardrails", issues,
                       {"forbidden_patterns", "forbidden_dependencies", "backup_retention",
                        "lock_timeout_ms", "lock_retry_ms"});
    if (!reader.valid_object()) {
        return config;
    }
    if (reader.has("forbidden_patterns")) {
        config.forbidden_patterns = reader.string_list("forbidden_patterns", true);
    }
    config.forbidden_dependencies = reader.string_list("forbidden_dependencies", false);
    config.backup_retention = reader.integer("backup_retention", false, config.backup_retention, 1);
    config.lock_timeout_ms = reader.integer("lock_timeout_ms", false, config.lock_timeout_ms, 0);
    config.lock_retry_ms = reader.integer("lock_retry_ms", false, config.lock_retry_ms, 1);
    return config;
}

nlohmann::json to_json(const GuardrailConfig& config) {
    return {
        {"forbidden_patterns", config.forbidden_patterns},
        {"forbidden_dependencies", config.forbidden_dependencies},
        {"backup_retention", config.backup_retention},
        {"lock_timeout_ms", config.lock_timeout_ms},
        {"lock_retry_ms", config.lock_retry_ms},
    };
}

ApprovedStack approved_stack_from_json(const nlohmann::json& j, std::vector<std::string>& issues) {
    ApprovedStack stack;
    FieldReader reader(j, "approved_stack", issues, {"technologies"});
    stack.technologies = reader.string_map("technologies");
    return stack;
}

nlohmann::json to_json(const ApprovedStack& stack) {
    nlohmann::json j = nlohmann::json::object();
    j["technologies"] = stack.technologies;
    return j;
}

DeferredFeatureList deferred_features_from_json(const nlohmann::json& j, std::vector<std::string>& issues) {
    DeferredFeatureList list;
    FieldReader reader(j, "deferred_features", issues, {"features"});
    if (const auto* features = reader.array("features", false)) {
        for (std::size_t i = 0; i < features->size(); ++i) {
            const auto& raw = (*features)[i];
            FieldReader entry(raw, reader.path("features", i), issues,
                              {"id", "description", "deferred_at", "reason", "tasks"});
            DeferredFeature feature;
            feature.id = entry.string("id", true);
            feature.description = entry.string("description", true);
            feature.deferred_at = entry.string("deferred_at", false);
            feature.reason = entry.string("reason", false);
            if (const auto* tasks = entry.array("tasks", false)) {
                feature.tasks = *tasks;
            }
            list.features.push_back(std::move(feature));
        }
    }
    return list;
}

nlohmann::json to_json(const DeferredFeature& feature) {
    return {
        {"id", feature.id},
        {"description", feature.description},
        {"deferred_at", feature.deferred_at},
        {"reason", feature.reason},
        {"tasks", feature.tasks},
    };
}

nlohmann::json to_json(const DeferredFeatureList& list) {
    nlohmann::json j = nlohmann::json::object();
    j["features"] = nlohmann::json::array();
    for (const auto& feature : list.features) {
        j["features"].push_back(to_json(feature));
    }
    return j;
}

}

}
