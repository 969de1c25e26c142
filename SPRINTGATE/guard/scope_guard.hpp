#pragma once

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/config_documents.hpp"
#include "model/task_graph.hpp"

namespace sprintgate::guard {

// What the execution collaborator must honor before touching files for a task.
struct ScopeBrief {
    std::string task_id;
    std::vector<std::string> must_implement;
    std::vector<std::string> must_not_implement;
    int max_file_changes = 0;
    std::vector<std::string> forbidden_patterns;
    std::vector<std::string> forbidden_dependencies;

    nlohmann::json to_json() const;
};

struct ScopeFinding {
    enum class Kind {
        FileBudget,
        MustNotImplement,
        ForbiddenPattern,
        ForbiddenDependency,
    };

    Kind kind = Kind::FileBudget;
    std::string file;
    std::string pattern;
    // 1-based line for content matches, 0 for path matches.
    int line = 0;
    std::string message;
};

const char* to_string(ScopeFinding::Kind kind);

class ScopeGuard {
public:
    // Throws SchemaError when a forbidden pattern does not compile.
    ScopeGuard(const GuardrailConfig& guardrails, const ScopeEnforcement& enforcement);

    ScopeBrief pre_check(const Task& task) const;

    // Every finding for a change set, in changed-file order. When `content_root` is given,
    // files under it are scanned line by line for forbidden patterns and dependencies.
    std::vector<ScopeFinding> inspect(const Task& task,
                                      const std::vector<std::string>& changed_files,
                                      const std::optional<std::filesystem::path>& content_root = std::nullopt) const;

    // Throws ScopeViolation listing every finding. Nothing is corrected automatically.
    void post_check(const Task& task,
                    const std::vector<std::string>& changed_files,
                    const std::optional<std::filesystem::path>& content_root = std::nullopt) const;

    std::vector<std::string> tech_findings(const Task& task, const ApprovedStack& approved_stack) const;

    // Every technology the task references must appear in the approved stack at exactly the same version.
    // Throws TechNonCompliance.
    void tech_compliance(const Task& task, const ApprovedStack& approved_stack) const;

private:
    struct CompiledPattern {
        std::string source;
        std::regex regex;
    };

    int budget_for(const Task& task) const;
    void scan_contents(const std::filesystem::path& file, const std::string& display,
                       std::vector<ScopeFinding>& findings) const;

    GuardrailConfig guardrails_;
    ScopeEnforcement enforcement_;
    std::vector<CompiledPattern> patterns_;
    std::vector<CompiledPattern> dependency_patterns_;
};

// True when `path` hits the marker: glob markers (*, ?, [) use fnmatch on the path and on its file name,
// plain markers match as a case-insensitive substring.
bool matches_marker(const std::string& path, const std::string& marker);

}
