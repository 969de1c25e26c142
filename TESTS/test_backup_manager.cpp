#include "doctest/doctest.h"

#include <filesystem>
#include <string>

#include "store/backup_manager.hpp"
#include "store/errors.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;
using namespace sprintgate;
using store::BackupManager;
using store::StatePaths;

TEST_CASE("backup snapshots every present state file and restores it byte for byte") {
    const StatePaths paths(testing::fresh_dir("backup_roundtrip"));
    testing::write_text(paths.task_graph(), "{\"graph\": 1}\n");
    testing::write_text(paths.progress(), "{\"progress\": 1}\n");

    BackupManager backups(paths, 5, testing::stepping_clock());
    const auto snapshot = backups.create();
    CHECK(snapshot.files == std::vector<std::string>{"task_graph.json", "progress.json"});
    CHECK(fs::is_directory(snapshot.directory));

    testing::write_text(paths.task_graph(), "{\"graph\": 2}\n");
    testing::write_text(paths.guardrails(), "{}\n");

    backups.restore(snapshot.timestamp);
    CHECK(testing::slurp(paths.task_graph()) == "{\"graph\": 1}\n");
    CHECK(testing::slurp(paths.progress()) == "{\"progress\": 1}\n");
    // Not part of the snapshot, so it goes away.
    CHECK_FALSE(fs::exists(paths.guardrails()));
}

TEST_CASE("backup rotation keeps the newest snapshots in timestamp order") {
    const StatePaths paths(testing::fresh_dir("backup_rotation"));
    testing::write_text(paths.task_graph(), "{}\n");

    BackupManager backups(paths, 3, testing::stepping_clock());
    std::vector<std::string> created;
    for (int i = 0; i < 5; ++i) {
        created.push_back(backups.create().timestamp);
    }
    const auto removed = backups.rotate();
    CHECK(removed == std::vector<std::string>{created[0], created[1]});

    const auto remaining = backups.list();
    REQUIRE(remaining.size() == 3);
    CHECK(remaining[0].timestamp == created[2]);
    CHECK(remaining[2].timestamp == created[4]);
}

TEST_CASE("snapshots taken within the same timestamp stay distinct") {
    const StatePaths paths(testing::fresh_dir("backup_collision"));
    testing::write_text(paths.task_graph(), "{}\n");

    BackupManager backups(paths, 10, [] { return std::string("2026-01-01T00:00:00.000Z"); });
    const auto first = backups.create();
    const auto second = backups.create();
    CHECK(first.timestamp != second.timestamp);
    CHECK(backups.list().size() == 2);
}

TEST_CASE("rotation orders colliding snapshots by their numeric suffix") {
    const StatePaths paths(testing::fresh_dir("backup_collision_rotation"));
    testing::write_text(paths.task_graph(), "{}\n");

    BackupManager backups(paths, 3, [] { return std::string("2026-01-01T00:00:00.000Z"); });
    std::vector<std::string> created;
    for (int i = 0; i < 12; ++i) {
        created.push_back(backups.create().timestamp);
    }
    CHECK(created[10] == "20260101T000000.000Z-10");

    const auto removed = backups.rotate();
    CHECK(removed == std::vector<std::string>(created.begin(), created.begin() + 9));

    const auto remaining = backups.list();
    REQUIRE(remaining.size() == 3);
    CHECK(remaining[0].timestamp == created[9]);
    CHECK(remaining[1].timestamp == created[10]);
    CHECK(remaining[2].timestamp == created[11]);
}

TEST_CASE("restoring an unknown snapshot is NotFound") {
    const StatePaths paths(testing::fresh_dir("backup_unknown"));
    BackupManager backups(paths, 10, testing::stepping_clock());
    CHECK_THROWS_AS(backups.restore("19990101T000000.000Z"), NotFound);
    CHECK_THROWS_AS(backups.restore("../escape"), NotFound);
}
