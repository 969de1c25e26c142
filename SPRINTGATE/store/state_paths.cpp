#include "store/state_paths.hpp"

#include <cstdlib>
#include <utility>

namespace sprintgate::store {

StatePaths::StatePaths(std::filesystem::path root_dir)
    : root(std::move(root_dir)) {}

std::vector<std::filesystem::path> StatePaths::state_files() const {
    return {task_graph(), progress(), deferred_features(), guardrails(), approved_stack()};
}

std::filesystem::path default_state_dir() {
    if (const char* dir = std::getenv("SPRINTGATE_STATE_DIR")) {
        if (*dir) {
            return std::filesystem::path(dir);
        }
    }
    return std::filesystem::current_path() / ".sprint";
}

}
