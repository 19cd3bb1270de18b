#pragma once

#include <chrono>
#include <string>
#include "core/errors/store_errors.hpp"

namespace runvault::core::time {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// RFC 3339 in UTC with millisecond precision, e.g. 2026-01-15T09:30:00.125Z.
std::string format_rfc3339(TimePoint point);

// Accepts a 'Z' or +hh:mm suffix and any number of fractional digits.
// Instants before the Unix epoch (such as 0001-01-01T00:00:00Z) map to TimePoint{}.
core::errors::Result<TimePoint> parse_rfc3339(const std::string& text);

std::string utc_month(TimePoint point);  // YYYY-MM
std::string utc_date(TimePoint point);   // YYYY-MM-DD

// strftime() in UTC, for display only.
std::string format_utc(TimePoint point, const char* pattern);

inline std::chrono::hours days(const int count) {
    return std::chrono::hours(24 * count);
}

}  // namespace runvault::core::time
