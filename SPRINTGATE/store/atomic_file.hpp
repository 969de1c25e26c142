#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace sprintgate::store {

// Writes `payload` to "<path>.tmp", syncs it and renames it over `path`. A failed write leaves the
// original untouched and reports to error_sink.
bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& payload,
                       std::ostream& error_sink);

std::optional<std::string> read_file(const std::filesystem::path& path);

// Injection point for the store's write step; tests swap in failing writers.
using FileWriter = std::function<bool(const std::filesystem::path&, const std::string&, std::ostream&)>;

}
