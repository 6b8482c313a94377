#pragma once

#include <ctime>
#include <string>

namespace shrine::util {

inline std::string formatUtc(const std::time_t ts, const char* fmt) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    char buffer[32];
    if (strftime(buffer, sizeof(buffer), fmt, &tm) == 0) return {};
    return {buffer};
}

inline std::string dateString(const std::time_t ts) { return formatUtc(ts, "%Y-%m-%d"); }
inline std::string timeString(const std::time_t ts) { return formatUtc(ts, "%H:%M"); }

}
