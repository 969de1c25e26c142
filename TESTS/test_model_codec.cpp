#include "doctest/doctest.h"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/config_documents.hpp"
#include "model/progress.hpp"
#include "model/task_graph.hpp"
#include "test_support.hpp"

using sprintgate::testing::GraphBuilder;

namespace {

bool mentions(const std::vector<std::string>& issues, const std::string& needle) {
    for (const auto& issue : issues) {
        if (issue.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}

TEST_CASE("task graph codec rejects unknown fields and reports every issue together") {
    GraphBuilder builder;
    builder.milestone("M1", {{"A", {}}, {"B", {"A"}}});
    auto doc = builder.json();
    doc["tasks"][0]["priority"] = "high";
    doc["tasks"][1]["status"] = "blocked";
    doc["milestones"][0]["owner"] = "someone";
    doc["tasks"][2].erase("title");

    std::vector<std::string> issues;
    sprintgate::model::task_graph_from_json(doc, issues);

    CHECK(issues.size() == 4);
    CHECK(mentions(issues, "task_graph.tasks[0].priority: unknown field"));
    CHECK(mentions(issues, "unknown task status 'blocked'"));
    CHECK(mentions(issues, "task_graph.milestones[0].owner: unknown field"));
    CHECK(mentions(issues, "task_graph.tasks[2].title: missing required field"));
}

TEST_CASE("task graph codec applies strategy and scope defaults") {
    GraphBuilder builder;
    builder.milestone("M1", {{"A", {}}});
    auto doc = builder.json();
    doc.erase("milestone_strategy");
    std::vector<std::string> issues;
    const auto graph = sprintgate::model::task_graph_from_json(doc, issues);
    REQUIRE(issues.empty());

    CHECK(graph.milestone_strategy.min_tasks == 3);
    CHECK(graph.milestone_strategy.max_tasks == 5);
    CHECK(graph.scope_enforcement.default_max_file_changes == 10);
    const auto* a = graph.find_task("A");
    REQUIRE(a != nullptr);
    CHECK(a->status == sprintgate::TaskStatus::Pending);
    CHECK(a->type == sprintgate::TaskType::Implementation);
    CHECK(graph.max_file_changes_for(*a) == 10);
    CHECK(graph.find_task("M1-V")->is_validation());
}

TEST_CASE("task graph survives a serialize and parse cycle unchanged") {
    GraphBuilder builder;
    builder.milestone("M1", {{"A", {}}, {"B", {"A"}}}).milestone("M2", {{"C", {"B"}}});
    auto doc = builder.json();
    doc["tasks"][0]["scope"] = {{"must_implement", {"parser"}}, {"must_not_implement", {"*.sql"}}, {"max_file_changes", 3}};
    doc["tasks"][0]["technologies"] = {{"nlohmann_json", "3.11.2"}};

    std::vector<std::string> issues;
    const auto graph = sprintgate::model::task_graph_from_json(doc, issues);
    REQUIRE(issues.empty());
    const auto dumped = sprintgate::model::to_json(graph);
    const auto reparsed = sprintgate::model::task_graph_from_json(dumped, issues);
    REQUIRE(issues.empty());
    CHECK(sprintgate::model::to_json(reparsed) == dumped);
    CHECK(reparsed.find_task("A")->scope.max_file_changes.value_or(0) == 3);
}

TEST_CASE("declared sequence follows milestone order then task order") {
    GraphBuilder builder;
    builder.milestone("M1", {{"B", {}}, {"A", {}}}).milestone("M2", {{"C", {}}});
    const auto graph = builder.build();
    std::vector<std::string> order;
    for (const auto* task : graph.declared_sequence()) {
        order.push_back(task->id);
    }
    CHECK(order == std::vector<std::string>{"B", "A", "M1-V", "C", "M2-V"});
}

TEST_CASE("progress codec rejects unknown sprint status and unknown validation outcome") {
    nlohmann::json doc = {
        {"sprint_id", "SPRINT-1"},
        {"status", "paused"},
        {"current_milestone", "M1"},
        {"validation_pending", false},
        {"validations", {{{"milestone", "M1"}, {"timestamp", "t"}, {"status", "maybe"}, {"issues", nlohmann::json::array()}}}},
    };
    std::vector<std::string> issues;
    sprintgate::model::progress_from_json(doc, issues);
    CHECK(mentions(issues, "unknown sprint status 'paused'"));
    CHECK(issues.size() == 2);
}

TEST_CASE("guardrail defaults include prerelease qualifiers") {
    std::vector<std::string> issues;
    const auto config = sprintgate::model::guardrails_from_json(nlohmann::json::object(), issues);
    REQUIRE(issues.empty());
    CHECK(config.backup_retention == 10);
    CHECK(config.lock_timeout_ms == 5000);
    CHECK_FALSE(config.forbidden_patterns.empty());

    const auto custom = sprintgate::model::guardrails_from_json(
        {{"forbidden_patterns", {"legacy_api"}}, {"backup_retention", 0}}, issues);
    CHECK(custom.forbidden_patterns == std::vector<std::string>{"legacy_api"});
    CHECK(mentions(issues, "guardrails.backup_retention: out of range"));
}
