#pragma once

#include <chrono>
#include <string>

namespace sem {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts "YYYY-MM-DD" and "YYYY-MM-DDTHH:MM:SS", the latter optionally
 * followed by fractional seconds (ignored) and "Z" or "+00:00". Throws
 * ValidationError on anything else, including days past the end of the month.
 */
Timestamp parse_iso8601(const std::string& text);

/**
 * @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string format_iso8601(Timestamp ts);

/**
 * @brief Seconds since the Unix epoch
 */
double to_epoch_seconds(Timestamp ts);

/**
 * @brief @p ts moved back by whole days; callers bound @p days to the
 * representable range of the clock
 */
inline Timestamp days_before(Timestamp ts, long long days) {
    return ts - std::chrono::duration_cast<Clock::duration>(std::chrono::hours(24LL * days));
}

} // namespace sem
