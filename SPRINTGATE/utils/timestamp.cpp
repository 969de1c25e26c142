#include "utils/timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace sprintgate::time {

std::string utc_now_iso8601() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32] = {0};
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    return std::string(buf);
}

Clock system_clock() {
    return []() { return utc_now_iso8601(); };
}

std::string compact(const std::string& iso_timestamp) {
    std::string out;
    out.reserve(iso_timestamp.size());
    for (char c : iso_timestamp) {
        if (c == '-' || c == ':') continue;
        out += c;
    }
    return out;
}

}
