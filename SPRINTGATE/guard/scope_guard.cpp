#include "guard/scope_guard.hpp"

#include <fstream>
#include <set>

#include <fnmatch.h>

#include "store/errors.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

namespace fs = std::filesystem;

namespace sprintgate::guard {
namespace {

std::string escape_regex(const std::string& literal) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : literal) {
        if (special.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::vector<std::string> unique_in_order(const std::vector<std::string>& files) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& raw : files) {
        const std::string file = strings::trim_copy(raw);
        if (!file.empty() && seen.insert(file).second) {
            out.push_back(file);
        }
    }
    return out;
}

}

const char* to_string(ScopeFinding::Kind kind) {
    switch (kind) {
        case ScopeFinding::Kind::FileBudget:          return "file_budget";
        case ScopeFinding::Kind::MustNotImplement:    return "must_not_implement";
        case ScopeFinding::Kind::ForbiddenPattern:    return "forbidden_pattern";
        case ScopeFinding::Kind::ForbiddenDependency: return "forbidden_dependency";
    }
    return "file_budget";
}

bool matches_marker(const std::string& path, const std::string& marker) {
    const std::string trimmed = strings::trim_copy(marker);
    if (trimmed.empty()) {
        return false;
    }
    if (trimmed.find_first_of("*?[") != std::string::npos) {
        const std::string name = fs::path(path).filename().string();
        return ::fnmatch(trimmed.c_str(), path.c_str(), 0) == 0 ||
               ::fnmatch(trimmed.c_str(), name.c_str(), 0) == 0;
    }
    return strings::contains_ci(path, trimmed);
}

nlohmann::json ScopeBrief::to_json() const {
    return {
        {"task_id", task_id},
        {"must_implement", must_implement},
        {"must_not_implement", must_not_implement},
        {"max_file_changes", max_file_changes},
        {"forbidden_patterns", forbidden_patterns},
        {"forbidden_dependencies", forbidden_dependencies},
    };
}

ScopeGuard::ScopeGuard(const GuardrailConfig& guardrails, const ScopeEnforcement& enforcement)
    : guardrails_(guardrails),
      enforcement_(enforcement) {
    std::vector<std::string> issues;
    for (const auto& source : guardrails_.forbidden_patterns) {
        try {
            patterns_.push_back(CompiledPattern{source, std::regex(source, std::regex::ECMAScript)});
        } catch (const std::regex_error& e) {
            issues.push_back("guardrails: forbidden pattern '" + source + "' is not a valid regex: " + e.what());
        }
    }
    for (const auto& name : guardrails_.forbidden_dependencies) {
        const std::string source = "(^|[^A-Za-z0-9_-])" + escape_regex(name) + "($|[^A-Za-z0-9_-])";
        dependency_patterns_.push_back(CompiledPattern{name, std::regex(source, std::regex::ECMAScript | std::regex::icase)});
    }
    if (!issues.empty()) {
        throw SchemaError(std::move(issues));
    }
}

int ScopeGuard::budget_for(const Task& task) const {
    return task.scope.max_file_changes.value_or(enforcement_.default_max_file_changes);
}

ScopeBrief ScopeGuard::pre_check(const Task& task) const {
    ScopeBrief brief;
    brief.task_id = task.id;
    brief.must_implement = task.scope.must_implement;
    brief.must_not_implement = task.scope.must_not_implement;
    brief.max_file_changes = budget_for(task);
    brief.forbidden_patterns = guardrails_.forbidden_patterns;
    brief.forbidden_dependencies = guardrails_.forbidden_dependencies;
    return brief;
}

void ScopeGuard::scan_contents(const fs::path& file, const std::string& display,
                               std::vector<ScopeFinding>& findings) const {
    std::ifstream in(file);
    if (!in.is_open()) {
        log::debug("[ScopeGuard] " + display + " not readable; content scan skipped");
        return;
    }
    std::string line;
    int number = 0;
    while (std::getline(in, line)) {
        ++number;
        for (const auto& pattern : patterns_) {
            if (std::regex_search(line, pattern.regex)) {
                findings.push_back({ScopeFinding::Kind::ForbiddenPattern, display, pattern.source, number,
                                    display + ":" + std::to_string(number) + " matches forbidden pattern '" +
                                        pattern.source + "'"});
            }
        }
        for (const auto& dependency : dependency_patterns_) {
            if (std::regex_search(line, dependency.regex)) {
                findings.push_back({ScopeFinding::Kind::ForbiddenDependency, display, dependency.source, number,
                                    display + ":" + std::to_string(number) + " references forbidden dependency '" +
                                        dependency.source + "'"});
            }
        }
    }
}

std::vector<ScopeFinding> ScopeGuard::inspect(const Task& task,
                                              const std::vector<std::string>& changed_files,
                                              const std::optional<fs::path>& content_root) const {
    std::vector<ScopeFinding> findings;
    const std::vector<std::string> files = unique_in_order(changed_files);
    const int budget = budget_for(task);

    if (static_cast<int>(files.size()) > budget) {
        const int excess = static_cast<int>(files.size()) - budget;
        for (std::size_t i = static_cast<std::size_t>(budget); i < files.size(); ++i) {
            findings.push_back({ScopeFinding::Kind::FileBudget, files[i], std::string(), 0,
                                files[i] + " is change " + std::to_string(i + 1) + " of " +
                                    std::to_string(files.size()) + "; max_file_changes is " + std::to_string(budget) +
                                    " (" + std::to_string(excess) + " over)"});
        }
    }

    for (const auto& file : files) {
        for (const auto& marker : task.scope.must_not_implement) {
            if (matches_marker(file, marker)) {
                findings.push_back({ScopeFinding::Kind::MustNotImplement, file, marker, 0,
                                    file + " matches must_not_implement marker '" + marker + "'"});
            }
        }
        for (const auto& pattern : patterns_) {
            if (std::regex_search(file, pattern.regex)) {
                findings.push_back({ScopeFinding::Kind::ForbiddenPattern, file, pattern.source, 0,
                                    file + " matches forbidden pattern '" + pattern.source + "'"});
            }
        }
        if (content_root) {
            const fs::path full = fs::path(file).is_absolute() ? fs::path(file) : *content_root / file;
            scan_contents(full, file, findings);
        }
    }
    return findings;
}

void ScopeGuard::post_check(const Task& task,
                            const std::vector<std::string>& changed_files,
                            const std::optional<fs::path>& content_root) const {
    const auto findings = inspect(task, changed_files, content_root);
    if (findings.empty()) {
        log::debug("[ScopeGuard] " + task.id + ": " + std::to_string(changed_files.size()) + " change(s) within scope");
        return;
    }
    std::vector<std::string> messages;
    messages.reserve(findings.size());
    for (const auto& finding : findings) {
        messages.push_back(finding.message);
    }
    log::warn("[ScopeGuard] " + task.id + ": " + std::to_string(findings.size()) + " scope violation(s)");
    throw ScopeViolation(task.id, std::move(messages));
}

std::vector<std::string> ScopeGuard::tech_findings(const Task& task, const ApprovedStack& approved_stack) const {
    std::vector<std::string> findings;
    for (const auto& [name, version] : task.technologies) {
        auto approved = approved_stack.technologies.find(name);
        if (approved == approved_stack.technologies.end()) {
            findings.push_back(name + " " + version + " is not in the approved stack");
        } else if (approved->second != version) {
            findings.push_back(name + " " + version + " does not equal approved version " + approved->second);
        }
        for (const auto& pattern : patterns_) {
            if (std::regex_search(version, pattern.regex)) {
                findings.push_back(name + " " + version + " matches forbidden pattern '" + pattern.source + "'");
            }
        }
        for (const auto& dependency : dependency_patterns_) {
            if (std::regex_search(name, dependency.regex)) {
                findings.push_back(name + " is a forbidden dependency");
            }
        }
    }
    return findings;
}

void ScopeGuard::tech_compliance(const Task& task, const ApprovedStack& approved_stack) const {
    auto findings = tech_findings(task, approved_stack);
    if (!findings.empty()) {
        log::warn("[ScopeGuard] " + task.id + ": " + std::to_string(findings.size()) + " technology finding(s)");
        throw TechNonCompliance(task.id, std::move(findings));
    }
}

}
