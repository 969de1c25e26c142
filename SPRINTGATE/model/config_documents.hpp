#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sprintgate {

struct GuardrailConfig {
    // ECMAScript regexes checked against changed paths, file contents and technology versions.
    std::vector<std::string> forbidden_patterns = default_forbidden_patterns();
    std::vector<std::string> forbidden_dependencies;
    int backup_retention = 10;
    int lock_timeout_ms = 5000;
    int lock_retry_ms = 50;

    static std::vector<std::string> default_forbidden_patterns();
};

struct ApprovedStack {
    std::map<std::string, std::string> technologies;
};

struct DeferredFeature {
    std::string id;
    std::string description;
    std::string deferred_at;
    std::string reason;
    nlohmann::json tasks = nlohmann::json::array();
};

struct DeferredFeatureList {
    std::vector<DeferredFeature> features;
};

namespace model {

GuardrailConfig guardrails_from_json(const nlohmann::json& j, std::vector<std::string>& issues);
nlohmann::json to_json(const GuardrailConfig& config);

ApprovedStack approved_stack_from_json(const nlohmann::json& j, std::vector<std::string>& issues);
nlohmann::json to_json(const ApprovedStack& stack);

DeferredFeatureList deferred_features_from_json(const nlohmann::json& j, std::vector<std::string>& issues);
nlohmann::json to_json(const DeferredFeatureList& list);
nlohmann::json to_json(const DeferredFeature& feature);

}

}
