#include "doctest/doctest.h"

#include <cstdlib>
#include <ostream>
#include <string>

#include <sys/wait.h>
#include <unistd.h>

#include "schedule/milestone_state_machine.hpp"
#include "store/atomic_file.hpp"
#include "store/errors.hpp"
#include "store/task_graph_store.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace sprintgate;
using testing::GraphBuilder;

namespace {

GraphBuilder two_milestones() {
    GraphBuilder builder;
    builder.milestone("M1", {{"A", {}}, {"B", {"A"}}}).milestone("M2", {{"C", {"B"}}});
    return builder;
}

void start(SprintState& state, const std::string& task_id) {
    schedule::MilestoneStateMachine machine(state.graph, state.progress, testing::stepping_clock());
    machine.start_task(task_id);
}

}

TEST_CASE("initialize writes every state document and refuses to run twice") {
    auto store = testing::make_store("store_init", two_milestones());
    const auto& paths = store.paths();
    for (const auto& file : paths.state_files()) {
        CHECK(fs::exists(file));
    }

    const auto state = store.load();
    CHECK(state.progress.current_milestone == "M1");
    CHECK(state.progress.total_tasks == 5);
    CHECK(state.progress.status == SprintStatus::Planned);
    REQUIRE(state.progress.history.size() == 1);
    CHECK(state.progress.history[0].event == "sprint_initialized");

    CHECK_THROWS_AS(store.initialize(two_milestones().build(), GuardrailConfig{}, ApprovedStack{}), InvalidTransition);
}

TEST_CASE("loading a graph with a dependency cycle fails with CycleDetected") {
    auto store = testing::make_store("store_cycle", two_milestones());
    auto graph = nlohmann::json::parse(testing::slurp(store.paths().task_graph()));
    for (auto& task : graph["tasks"]) {
        if (task["id"] == "A") {
            task["dependencies"] = {"C"};
        }
    }
    testing::write_text(store.paths().task_graph(), graph.dump(2));

    try {
        store.load();
        FAIL("cyclic graph loaded");
    } catch (const CycleDetected& e) {
        CHECK_FALSE(e.recoverable());
        const auto& cycle = e.cycle();
        REQUIRE(cycle.size() == 4);
        CHECK(cycle.front() == cycle.back());
        CHECK(std::string(e.what()).find("A") != std::string::npos);
    }
}

TEST_CASE("load collects every referential problem into one SchemaError") {
    auto store = testing::make_store("store_schema", two_milestones());
    auto graph = nlohmann::json::parse(testing::slurp(store.paths().task_graph()));
    graph["tasks"][1]["dependencies"] = {"GHOST"};
    graph["milestones"][1]["tasks"] = {"C"};
    graph["tasks"].push_back({{"id", "A"}, {"title", "Duplicate"}, {"milestone", "M1"}});
    testing::write_text(store.paths().task_graph(), graph.dump(2));

    try {
        store.load();
        FAIL("broken graph loaded");
    } catch (const SchemaError& e) {
        const auto& issues = e.details();
        CHECK(issues.size() >= 3);
        const std::string message = e.what();
        CHECK(message.find("dependency 'GHOST' does not exist") != std::string::npos);
        CHECK(message.find("duplicate id") != std::string::npos);
        CHECK(message.find("exactly one must end the milestone") != std::string::npos);
    }
}

TEST_CASE("a dependency on a task in a later milestone is a schema error") {
    GraphBuilder backwards;
    backwards.milestone("M1", {{"A", {"B"}}}).milestone("M2", {{"B", {}}});

    store::TaskGraphStore fresh(testing::fresh_dir("store_forward_dependency_init"), testing::test_options());
    try {
        fresh.initialize(backwards.build(), GuardrailConfig{}, ApprovedStack{});
        FAIL("graph with a forward milestone dependency initialized");
    } catch (const SchemaError& e) {
        CHECK(std::string(e.what()).find("dependency 'B' is in milestone M2, after its own milestone M1") != std::string::npos);
    }
    CHECK_FALSE(fs::exists(fresh.paths().task_graph()));

    // The same shape edited into an existing graph is refused on load.
    auto store = testing::make_store("store_forward_dependency_load", two_milestones());
    auto graph = nlohmann::json::parse(testing::slurp(store.paths().task_graph()));
    for (auto& task : graph["tasks"]) {
        if (task["id"] == "B") {
            task["dependencies"] = {"A", "C"};
        }
        if (task["id"] == "C") {
            task["dependencies"] = nlohmann::json::array();
        }
    }
    testing::write_text(store.paths().task_graph(), graph.dump(2));
    CHECK_THROWS_AS(store.load(), SchemaError);
}

TEST_CASE("atomic_update that fails validation leaves every file byte-identical") {
    auto store = testing::make_store("store_validation_failure", two_milestones());
    const auto before = testing::read_state_files(store.paths());

    CHECK_THROWS_AS(store.atomic_update([](SprintState& state) {
        state.graph.find_task("A")->dependencies.push_back("B");
    }), CycleDetected);
    CHECK(testing::read_state_files(store.paths()) == before);

    CHECK_THROWS_AS(store.atomic_update([](SprintState& state) {
        state.graph.find_task("C")->dependencies.push_back("NOPE");
    }), SchemaError);
    CHECK(testing::read_state_files(store.paths()) == before);

    CHECK_THROWS_AS(store.atomic_update([](SprintState&) {
        throw InvalidTransition("mutation refused");
    }), InvalidTransition);
    CHECK(testing::read_state_files(store.paths()) == before);
}

TEST_CASE("simulated write failure restores task graph content identical to the pre-failure state") {
    auto options = testing::test_options();
    bool armed = false;
    options.writer = [&armed](const fs::path& path, const std::string& payload, std::ostream& errors) {
        // task_graph.json goes through; progress.json then fails half way through the set.
        if (armed && path.filename() == "progress.json") {
            errors << "simulated disk full writing " << path.string();
            return false;
        }
        return store::write_file_atomic(path, payload, errors);
    };
    auto store = testing::make_store("store_write_failure", two_milestones(), options);
    const auto before = testing::read_state_files(store.paths());

    armed = true;
    try {
        store.atomic_update([](SprintState& state) { start(state, "A"); });
        FAIL("write failure not reported");
    } catch (const StateCorruptionOnWrite& e) {
        CHECK_FALSE(e.recoverable());
        CHECK(std::string(e.what()).find("progress.json") != std::string::npos);
    }
    CHECK(testing::read_state_files(store.paths()) == before);
    CHECK(store.load().graph.find_task("A")->status == TaskStatus::Pending);

    armed = false;
    store.atomic_update([](SprintState& state) { start(state, "A"); });
    CHECK(store.load().graph.find_task("A")->status == TaskStatus::InProgress);
}

TEST_CASE("every committed update is preceded by a restorable snapshot") {
    auto options = testing::test_options();
    options.backup_retention = 2;
    auto store = testing::make_store("store_backups", two_milestones(), options);
    const auto pristine = testing::read_state_files(store.paths());

    store.atomic_update([](SprintState& state) { start(state, "A"); });
    store.atomic_update([](SprintState& state) {
        schedule::MilestoneStateMachine machine(state.graph, state.progress, testing::stepping_clock());
        machine.complete_task("A");
    });

    const auto backups = store.backups();
    REQUIRE(backups.size() == 2);
    // The oldest retained snapshot was taken right before "A" started.
    store.restore_backup(backups.front().timestamp);
    CHECK(testing::read_state_files(store.paths()) == pristine);
    CHECK(store.load().graph.find_task("A")->status == TaskStatus::Pending);
}

TEST_CASE("counters are recomputed on every mutation") {
    auto store = testing::make_store("store_counters", two_milestones());
    const auto committed = store.atomic_update([](SprintState& state) {
        start(state, "A");
        state.progress.completed_tasks = 42;
    });
    CHECK(committed.progress.completed_tasks == 0);
    CHECK(committed.progress.total_tasks == 5);
}

TEST_CASE("a writer killed between two renames is rolled back by the next reader") {
    auto store = testing::make_store("store_crash_mid_commit", two_milestones());
    const auto before = testing::read_state_files(store.paths());

    const pid_t child = fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        auto options = testing::test_options();
        options.writer = [](const fs::path& path, const std::string& payload, std::ostream& errors) {
            const bool written = store::write_file_atomic(path, payload, errors);
            if (path.filename() == "task_graph.json") {
                std::_Exit(9);
            }
            return written;
        };
        try {
            store::TaskGraphStore crashing(store.paths().root, options);
            crashing.atomic_update([](SprintState& state) { start(state, "A"); });
        } catch (const std::exception&) {
            std::_Exit(2);
        }
        std::_Exit(0);
    }

    int status = 0;
    REQUIRE(waitpid(child, &status, 0) == child);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 9);
    CHECK(fs::exists(store.paths().commit_marker()));
    CHECK(testing::read_state_files(store.paths()) != before);

    const auto state = store.load();
    CHECK(state.graph.find_task("A")->status == TaskStatus::Pending);
    CHECK(testing::read_state_files(store.paths()) == before);
    CHECK_FALSE(fs::exists(store.paths().commit_marker()));

    store.atomic_update([](SprintState& next) { start(next, "A"); });
    CHECK(store.load().graph.find_task("A")->status == TaskStatus::InProgress);
    CHECK_FALSE(fs::exists(store.paths().commit_marker()));
}
