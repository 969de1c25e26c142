#include "utils/log.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

#include "utils/string_utils.hpp"

namespace sprintgate::log {
namespace {

bool env_flag_set(const char* value) {
    return value && (*value == '1' || *value == 'y' || *value == 'Y' || *value == 't' || *value == 'T');
}

// Process-wide sink, configured from the environment on first use.
struct Sink {
    std::mutex mutex;
    Level level = Level::Warn;
    std::unique_ptr<std::ofstream> file;
    const std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();

    Sink() {
        if (const char* value = std::getenv("SPRINTGATE_LOG_LEVEL")) {
            level = parse_level(value).value_or(level);
        }
        const char* path = std::getenv("SPRINTGATE_LOG_FILE");
        if (path && *path) {
            const auto mode = std::ios::out | (env_flag_set(std::getenv("SPRINTGATE_LOG_APPEND")) ? std::ios::app
                                                                                                : std::ios::trunc);
            auto out = std::make_unique<std::ofstream>(path, mode);
            if (out->good()) {
                file = std::move(out);
            }
        }
    }
};

Sink& sink() {
    static Sink instance;
    return instance;
}

const char* level_tag(Level level) {
    switch (level) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
    }
    return "INFO";
}

// stdout carries the structured operation result, so every level goes to stderr.
void write_line(Level level, const std::string& message) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) > static_cast<int>(s.level)) {
        return;
    }
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - s.origin;
    std::ostringstream line;
    line << '[' << level_tag(level) << "] +" << std::fixed << std::setprecision(3) << elapsed.count() << "s: "
         << message << '\n';
    std::cerr << line.str() << std::flush;
    if (s.file) {
        *s.file << line.str() << std::flush;
    }
}

}

void set_level(Level level) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

std::optional<Level> parse_level(const std::string& value) {
    const std::string lower = strings::to_lower_copy(strings::trim_copy(value));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

void error(const std::string& message) { write_line(Level::Error, message); }
void warn (const std::string& message) { write_line(Level::Warn,  message); }
void info (const std::string& message) { write_line(Level::Info,  message); }
void debug(const std::string& message) { write_line(Level::Debug, message); }

}
