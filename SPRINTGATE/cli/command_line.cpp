#include "cli/command_line.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>

#include <nlohmann/json.hpp>

#include "cli/operations.hpp"
#include "store/atomic_file.hpp"
#include "store/state_paths.hpp"
#include "store/task_graph_store.hpp"
#include "utils/log.hpp"

namespace sprintgate::cli {
namespace {

struct OperationSpec {
    std::size_t min_args;
    std::size_t max_args;
    const char* synopsis;
};

constexpr std::size_t kUnbounded = static_cast<std::size_t>(-1);

const std::map<std::string, OperationSpec>& operation_table() {
    static const std::map<std::string, OperationSpec> table = {
        {"init", {1, 1, "init <plan.json>"}},
        {"get-current-status", {0, 0, "get-current-status"}},
        {"get-next-task", {0, 1, "get-next-task [task-id] [--milestone M]"}},
        {"get-task-details", {1, 1, "get-task-details <task-id>"}},
        {"validate-dependencies", {1, 1, "validate-dependencies <task-id>"}},
        {"check-scope-compliance", {1, 1, "check-scope-compliance <task-id> [--files f...] [--root dir]"}},
        {"start-task", {1, 1, "start-task <task-id>"}},
        {"complete-task", {1, 1, "complete-task <task-id> [--files f...] [--root dir]"}},
        {"get-milestone-status", {1, 1, "get-milestone-status <milestone-id>"}},
        {"request-validation", {1, 1, "request-validation <milestone-id>"}},
        {"record-validation", {2, kUnbounded, "record-validation <milestone-id> passed|failed [issue...]"}},
        {"apply-enhancement", {1, 1, "apply-enhancement <description> --tasks <file.json> [--defer]"}},
        {"list-deferred", {0, 0, "list-deferred"}},
        {"list-backups", {0, 0, "list-backups"}},
        {"restore-backup", {1, 1, "restore-backup <timestamp>"}},
    };
    return table;
}

std::string flag_value(int argc, const char* const argv[], int& i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
        throw UsageError(flag + " needs a value");
    }
    return argv[++i];
}

nlohmann::json read_json_file(const std::filesystem::path& path, const char* what) {
    auto contents = store::read_file(path);
    if (!contents) {
        throw UsageError(std::string("cannot read ") + what + " '" + path.string() + "'");
    }
    try {
        return nlohmann::json::parse(*contents);
    } catch (const nlohmann::json::parse_error& e) {
        throw UsageError(std::string(what) + " '" + path.string() + "' is not valid JSON: " + e.what());
    }
}

store::StoreOptions store_options(const store::StatePaths& paths) {
    store::StoreOptions options = store::StoreOptions::from_guardrails(store::TaskGraphStore::peek_guardrails(paths));
    if (const char* value = std::getenv("SPRINTGATE_LOCK_TIMEOUT_MS")) {
        char* end = nullptr;
        errno = 0;
        const long ms = std::strtol(value, &end, 10);
        if (errno == 0 && end && *end == '\0' && ms >= 0) {
            options.lock.timeout = std::chrono::milliseconds(ms);
        } else {
            log::warn(std::string("[CLI] Ignoring SPRINTGATE_LOCK_TIMEOUT_MS='") + value + "'");
        }
    }
    return options;
}

int emit(std::ostream& out, const OperationResult& result) {
    out << result.to_json().dump(2) << '\n';
    out.flush();
    return result.exit_code;
}

int emit_usage_error(std::ostream& out, const std::string& operation, const std::string& message) {
    OperationResult result;
    result.operation = operation;
    result.fail(ErrorInfo{"usage_error", message, false, {}}, kExitUsage);
    print_usage(std::cerr);
    return emit(out, result);
}

OperationResult dispatch(const CommandLine& cmd, Operations& ops) {
    const auto& op = cmd.operation;
    const auto& args = cmd.positional;
    const auto arg = [&](std::size_t i) -> const std::string& { return args.at(i); };

    if (op == "init") {
        return ops.init(read_json_file(arg(0), "plan"));
    }
    if (op == "get-current-status") {
        return ops.get_current_status();
    }
    if (op == "get-next-task") {
        std::optional<std::string> task_id;
        if (!args.empty()) {
            task_id = arg(0);
        }
        return ops.get_next_task(task_id, cmd.milestone);
    }
    if (op == "get-task-details") {
        return ops.get_task_details(arg(0));
    }
    if (op == "validate-dependencies") {
        return ops.validate_dependencies(arg(0));
    }
    if (op == "check-scope-compliance") {
        return ops.check_scope_compliance(arg(0), cmd.files, cmd.root);
    }
    if (op == "start-task") {
        return ops.start_task(arg(0));
    }
    if (op == "complete-task") {
        return ops.complete_task(arg(0), cmd.files, cmd.root);
    }
    if (op == "get-milestone-status") {
        return ops.get_milestone_status(arg(0));
    }
    if (op == "request-validation") {
        return ops.request_validation(arg(0));
    }
    if (op == "record-validation") {
        const auto outcome = parse_validation_outcome(arg(1));
        if (!outcome) {
            throw UsageError("validation outcome must be passed or failed, got '" + arg(1) + "'");
        }
        return ops.record_validation(arg(0), *outcome, std::vector<std::string>(args.begin() + 2, args.end()));
    }
    if (op == "apply-enhancement") {
        if (!cmd.tasks_file) {
            throw UsageError("apply-enhancement needs --tasks <file.json>");
        }
        return ops.apply_enhancement(arg(0), read_json_file(*cmd.tasks_file, "tasks file"), cmd.defer);
    }
    if (op == "list-deferred") {
        return ops.list_deferred();
    }
    if (op == "list-backups") {
        return ops.list_backups();
    }
    if (op == "restore-backup") {
        return ops.restore_backup(arg(0));
    }
    throw UsageError("unknown operation '" + op + "'");
}

}

CommandLine CommandLine::parse(int argc, const char* const argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string token = argv[i] ? argv[i] : "";
        if (token == "-h" || token == "--help") {
            cmd.help = true;
        } else if (token == "--state-dir") {
            cmd.state_dir = flag_value(argc, argv, i);
        } else if (token == "--log-level") {
            cmd.log_level = flag_value(argc, argv, i);
        } else if (token == "--root") {
            cmd.root = flag_value(argc, argv, i);
        } else if (token == "--tasks") {
            cmd.tasks_file = flag_value(argc, argv, i);
        } else if (token == "--milestone") {
            cmd.milestone = flag_value(argc, argv, i);
        } else if (token == "--defer") {
            cmd.defer = true;
        } else if (token == "--files") {
            // Consumes paths up to the next flag; an empty list is a valid change set.
            cmd.files.emplace();
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                cmd.files->push_back(argv[++i]);
            }
        } else if (token.rfind("--", 0) == 0) {
            throw UsageError("unknown flag '" + token + "'");
        } else if (cmd.operation.empty()) {
            cmd.operation = token;
        } else {
            cmd.positional.push_back(token);
        }
    }
    return cmd;
}

void print_usage(std::ostream& os) {
    os << "usage: sprintgate [--state-dir DIR] [--log-level error|warn|info|debug] <operation> [args]\n"
       << "operations:\n";
    for (const auto& entry : operation_table()) {
        os << "  " << entry.second.synopsis << '\n';
    }
}

int run_cli(int argc, const char* const argv[], std::ostream& out) {
    CommandLine cmd;
    try {
        cmd = CommandLine::parse(argc, argv);
    } catch (const UsageError& e) {
        return emit_usage_error(out, "", e.what());
    }
    if (cmd.help) {
        print_usage(std::cerr);
        return kExitOk;
    }
    if (cmd.log_level) {
        const auto level = log::parse_level(*cmd.log_level);
        if (!level) {
            return emit_usage_error(out, cmd.operation, "unknown log level '" + *cmd.log_level + "'");
        }
        log::set_level(*level);
    }
    if (cmd.operation.empty()) {
        return emit_usage_error(out, "", "no operation given");
    }

    const auto spec = operation_table().find(cmd.operation);
    if (spec == operation_table().end()) {
        return emit_usage_error(out, cmd.operation, "unknown operation '" + cmd.operation + "'");
    }
    const std::size_t count = cmd.positional.size();
    if (count < spec->second.min_args || count > spec->second.max_args) {
        return emit_usage_error(out, cmd.operation, std::string("expected: ") + spec->second.synopsis);
    }

    const store::StatePaths paths(cmd.state_dir.value_or(store::default_state_dir()));
    log::debug("[CLI] " + cmd.operation + " against " + paths.root.string());
    try {
        store::TaskGraphStore store(paths.root, store_options(paths));
        Operations ops(store);
        return emit(out, dispatch(cmd, ops));
    } catch (const UsageError& e) {
        return emit_usage_error(out, cmd.operation, e.what());
    } catch (const std::exception& e) {
        log::error(std::string("[CLI] ") + cmd.operation + " aborted: " + e.what());
        OperationResult result;
        result.operation = cmd.operation;
        result.fail(ErrorInfo{"internal_error", e.what(), false, {}}, kExitFatal);
        return emit(out, result);
    }
}

}
