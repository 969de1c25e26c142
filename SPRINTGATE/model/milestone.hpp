#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sprintgate {

enum class MilestoneStatus {
    NotStarted,
    InProgress,
    Complete,
    Validated,
};

const char* to_string(MilestoneStatus status);
std::optional<MilestoneStatus> parse_milestone_status(const std::string& value);

struct MilestoneStrategy {
    int min_tasks = 3;
    int max_tasks = 5;
};

struct Milestone {
    std::string id;
    std::string title;
    MilestoneStatus status = MilestoneStatus::NotStarted;
    // Declared order; the last entry is the milestone's single validation task.
    std::vector<std::string> tasks;
    std::optional<int> min_tasks;
    std::optional<int> max_tasks;

    // Complete and Validated milestones accept no new tasks.
    bool is_open() const {
        return status == MilestoneStatus::NotStarted || status == MilestoneStatus::InProgress;
    }
};

namespace model {

Milestone milestone_from_json(const nlohmann::json& j, const std::string& where, std::vector<std::string>& issues);
nlohmann::json to_json(const Milestone& milestone);

}

}
