#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "doctest/doctest.h"

#include "model/task_graph.hpp"
#include "store/task_graph_store.hpp"
#include "utils/timestamp.hpp"

namespace sprintgate::testing {

namespace fs = std::filesystem;

inline fs::path test_root() {
#ifdef SPRINTGATE_TEST_ROOT
    return fs::path(SPRINTGATE_TEST_ROOT);
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

// Empty directory under the test root, wiped first so cases never see each other's state.
inline fs::path fresh_dir(const std::string& name) {
    const fs::path dir = test_root() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    REQUIRE(ec.value() == 0);
    return dir;
}

// Deterministic, strictly increasing timestamps one second apart.
inline time::Clock stepping_clock() {
    auto tick = std::make_shared<int>(0);
    return [tick]() {
        const int t = (*tick)++;
        char buf[32] = {0};
        std::snprintf(buf, sizeof(buf), "2026-01-01T%02d:%02d:%02d.000Z", (t / 3600) % 24, (t / 60) % 60, t % 60);
        return std::string(buf);
    };
}

inline std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    REQUIRE(in.is_open());
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void write_text(const fs::path& path, const std::string& text) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    REQUIRE(out.is_open());
    out << text;
}

// Contents of every state file that exists, keyed by file name.
inline std::map<std::string, std::string> read_state_files(const store::StatePaths& paths) {
    std::map<std::string, std::string> files;
    for (const auto& file : paths.state_files()) {
        if (fs::exists(file)) {
            files[file.filename().string()] = slurp(file);
        }
    }
    return files;
}

struct WorkTask {
    std::string id;
    std::vector<std::string> dependencies;
};

// Builds task_graph.json documents: each milestone gets its work tasks followed by "<milestone>-V".
class GraphBuilder {
public:
    explicit GraphBuilder(std::string sprint_id = "SPRINT-1") {
        doc_ = {
            {"sprint_id", std::move(sprint_id)},
            {"milestone_strategy", {{"min_tasks", 1}, {"max_tasks", 5}}},
            {"milestones", nlohmann::json::array()},
            {"tasks", nlohmann::json::array()},
        };
    }

    GraphBuilder& milestone(const std::string& id, const std::vector<WorkTask>& work) {
        nlohmann::json ids = nlohmann::json::array();
        for (const auto& task : work) {
            doc_["tasks"].push_back({
                {"id", task.id},
                {"title", "Task " + task.id},
                {"milestone", id},
                {"dependencies", task.dependencies},
            });
            ids.push_back(task.id);
        }
        const std::string validation = id + "-V";
        doc_["tasks"].push_back({
            {"id", validation},
            {"title", "Validate " + id},
            {"type", "validation"},
            {"milestone", id},
        });
        ids.push_back(validation);
        doc_["milestones"].push_back({{"id", id}, {"title", "Milestone " + id}, {"tasks", std::move(ids)}});
        return *this;
    }

    nlohmann::json& json() { return doc_; }
    const nlohmann::json& json() const { return doc_; }

    TaskGraph build() const {
        std::vector<std::string> issues;
        TaskGraph graph = model::task_graph_from_json(doc_, issues);
        if (!issues.empty()) {
            FAIL("fixture graph rejected: " << issues.front());
        }
        return graph;
    }

private:
    nlohmann::json doc_;
};

inline store::StoreOptions test_options() {
    store::StoreOptions options;
    options.clock = stepping_clock();
    options.lock.timeout = std::chrono::milliseconds(200);
    options.lock.retry_interval = std::chrono::milliseconds(10);
    return options;
}

// A freshly initialized state directory holding `graph`.
inline store::TaskGraphStore make_store(const std::string& name,
                                        const GraphBuilder& graph,
                                        store::StoreOptions options = test_options(),
                                        const GuardrailConfig& guardrails = GuardrailConfig{},
                                        const ApprovedStack& stack = ApprovedStack{}) {
    store::TaskGraphStore store(fresh_dir(name), std::move(options));
    store.initialize(graph.build(), guardrails, stack);
    return store;
}

}
