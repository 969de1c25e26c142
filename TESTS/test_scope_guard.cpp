#include "doctest/doctest.h"

#include <string>
#include <vector>

#include "guard/scope_guard.hpp"
#include "store/errors.hpp"
#include "test_support.hpp"

using namespace sprintgate;
using guard::ScopeFinding;
using guard::ScopeGuard;

namespace {

Task scoped_task(int max_files) {
    Task task;
    task.id = "T1";
    task.title = "Parser";
    task.milestone = "M1";
    task.scope.must_implement = {"tokenizer"};
    task.scope.must_not_implement = {"*.sql", "payments"};
    task.scope.max_file_changes = max_files;
    return task;
}

}

TEST_CASE("post_check over the file budget names the file past the limit") {
    ScopeGuard guard(GuardrailConfig{}, ScopeEnforcement{});
    const Task task = scoped_task(3);
    const std::vector<std::string> changed = {"src/a.cpp", "src/b.cpp", "src/c.cpp", "src/d.cpp"};

    const auto findings = guard.inspect(task, changed);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].kind == ScopeFinding::Kind::FileBudget);
    CHECK(findings[0].file == "src/d.cpp");
    CHECK(findings[0].message.find("max_file_changes is 3") != std::string::npos);
    CHECK(findings[0].message.find("1 over") != std::string::npos);

    try {
        guard.post_check(task, changed);
        FAIL("over-budget change set accepted");
    } catch (const ScopeViolation& e) {
        CHECK(e.recoverable());
        REQUIRE(e.details().size() == 1);
        CHECK(e.details()[0].rfind("src/d.cpp", 0) == 0);
    }

    CHECK_NOTHROW(guard.post_check(task, {"src/a.cpp", "src/b.cpp", "src/c.cpp", "src/a.cpp"}));
}

TEST_CASE("file budget falls back to the graph-wide default") {
    ScopeEnforcement enforcement;
    enforcement.default_max_file_changes = 1;
    ScopeGuard guard(GuardrailConfig{}, enforcement);
    Task task = scoped_task(0);
    task.scope.max_file_changes.reset();

    CHECK(guard.pre_check(task).max_file_changes == 1);
    const auto findings = guard.inspect(task, {"one.cpp", "two.cpp"});
    REQUIRE(findings.size() == 1);
    CHECK(findings[0].file == "two.cpp");
}

TEST_CASE("must_not_implement markers match globs and substrings") {
    ScopeGuard guard(GuardrailConfig{}, ScopeEnforcement{});
    const Task task = scoped_task(10);

    const auto findings = guard.inspect(task, {"db/schema.sql", "src/Payments/api.cpp", "src/parser.cpp"});
    REQUIRE(findings.size() == 2);
    CHECK(findings[0].kind == ScopeFinding::Kind::MustNotImplement);
    CHECK(findings[0].file == "db/schema.sql");
    CHECK(findings[0].pattern == "*.sql");
    CHECK(findings[1].file == "src/Payments/api.cpp");
    CHECK(findings[1].pattern == "payments");

    CHECK(guard::matches_marker("deep/dir/file.sql", "*.sql"));
    CHECK_FALSE(guard::matches_marker("src/sqlite.cpp", "*.sql"));
}

TEST_CASE("forbidden patterns and dependencies are reported with file and line") {
    GuardrailConfig guardrails;
    guardrails.forbidden_dependencies = {"left-pad"};
    ScopeGuard guard(guardrails, ScopeEnforcement{});
    const Task task = scoped_task(10);

    const auto root = testing::fresh_dir("scope_guard_contents");
    testing::write_text(root / "package.json", "{\n  \"react\": \"19.0.0-rc.1\",\n  \"left-pad\": \"1.3.0\"\n}\n");
    testing::write_text(root / "clean.txt", "nothing to see\n");

    const auto findings = guard.inspect(task, {"package.json", "clean.txt"}, root);
    REQUIRE(findings.size() == 2);
    CHECK(findings[0].kind == ScopeFinding::Kind::ForbiddenPattern);
    CHECK(findings[0].file == "package.json");
    CHECK(findings[0].line == 2);
    CHECK(findings[1].kind == ScopeFinding::Kind::ForbiddenDependency);
    CHECK(findings[1].line == 3);
    CHECK(findings[1].pattern == "left-pad");

    // Without a content root only paths are checked.
    CHECK(guard.inspect(task, {"package.json", "clean.txt"}).empty());
    CHECK(guard.inspect(task, {"vendor/lib-2.0.0-beta.1.tar"}).size() == 1);
}

TEST_CASE("tech compliance demands exact approved versions") {
    GuardrailConfig guardrails;
    guardrails.forbidden_dependencies = {"moment"};
    ScopeGuard guard(guardrails, ScopeEnforcement{});
    ApprovedStack stack;
    stack.technologies = {{"react", "18.2.0"}, {"postgres", "16.1"}};

    Task task = scoped_task(5);
    task.technologies = {{"react", "18.2.0"}, {"postgres", "16.1"}};
    CHECK(guard.tech_findings(task, stack).empty());
    CHECK_NOTHROW(guard.tech_compliance(task, stack));

    task.technologies = {{"react", "^18.2.0"}};
    auto findings = guard.tech_findings(task, stack);
    REQUIRE(findings.size() == 1);
    CHECK(findings[0] == "react ^18.2.0 does not equal approved version 18.2.0");

    task.technologies = {{"react", "18.3.0-beta.2"}, {"moment", "2.29.4"}};
    findings = guard.tech_findings(task, stack);
    CHECK(findings.size() == 4);
    CHECK_THROWS_AS(guard.tech_compliance(task, stack), TechNonCompliance);
}

TEST_CASE("an invalid guardrail regex is a schema error") {
    GuardrailConfig guardrails;
    guardrails.forbidden_patterns = {"(unclosed"};
    CHECK_THROWS_AS(ScopeGuard(guardrails, ScopeEnforcement{}), SchemaError);
}
