#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sprintgate::cli {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One parsed invocation: `sprintgate [--state-dir D] [--log-level L] <operation> [args...] [flags...]`.
struct CommandLine {
    std::string operation;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> state_dir;
    std::optional<std::string> log_level;
    std::optional<std::vector<std::string>> files;
    std::optional<std::filesystem::path> root;
    std::optional<std::filesystem::path> tasks_file;
    std::optional<std::string> milestone;
    bool defer = false;
    bool help = false;

    // Throws UsageError for unknown flags or missing flag values.
    static CommandLine parse(int argc, const char* const argv[]);
};

void print_usage(std::ostream& os);

// Runs one invocation, printing the result JSON to `out`. Returns the process exit code.
int run_cli(int argc, const char* const argv[], std::ostream& out);

}
