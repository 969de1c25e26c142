#pragma once

#include <functional>
#include <string>

namespace sprintgate::time {

// Produces ISO-8601 UTC timestamps; injected wherever state records time so tests stay deterministic.
using Clock = std::function<std::string()>;

// "2026-10-18T21:52:00.123Z"
std::string utc_now_iso8601();

Clock system_clock();

// "2026-10-18T21:52:00.123Z" -> "20261018T215200.123Z", safe as a directory name and sortable.
std::string compact(const std::string& iso_timestamp);

}
