#pragma once

#include <string>

// Compact duration for result tables: "850ms", "8.4s", "14m22s", "2h35m".
std::string format_elapsed(double seconds);

// Shortens a recorded timestamp ("2025-01-15T14:35:22Z") to "Jan 15 14:35".
// Empty input gives "-", anything unparsable gives "?".
std::string format_timestamp(const std::string& iso_time);
