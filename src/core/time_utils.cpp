#include "time_utils.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdio>

namespace {

const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                              "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

} // namespace

std::string format_elapsed(double seconds) {
    if (!(seconds > 0)) return "0ms";
    if (seconds < 1.0) return fmt::format("{}ms", std::lround(seconds * 1000.0));
    if (seconds < 60.0) return fmt::format("{:.1f}s", seconds);

    long total = static_cast<long>(seconds);
    if (total < 3600) return fmt::format("{}m{}s", total / 60, total % 60);
    return fmt::format("{}h{}m", total / 3600, (total % 3600) / 60);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(iso_time.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d",
                    &year, &month, &day, &hour, &minute, &second) != 6) {
        return "?";
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59) return "?";
    return fmt::format("{} {} {:02}:{:02}", MONTHS[month - 1], day, hour, minute);
}
