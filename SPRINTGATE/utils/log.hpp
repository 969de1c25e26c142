#pragma once

#include <optional>
#include <string>

namespace sprintgate::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

// Overrides SPRINTGATE_LOG_LEVEL for the rest of the process.
void set_level(Level level);

// error|warn|warning|info|debug in any case; nullopt for anything else.
std::optional<Level> parse_level(const std::string& value);

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

}
