#pragma once

#include <chrono>
#include <string>

namespace drivescore::time {

using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using UtcDay    = std::chrono::sys_days;

/// Calendar day (UTC) containing `t`.
inline UtcDay utc_day(Timestamp t)
{
    return std::chrono::floor<std::chrono::days>(t);
}

/// Signed elapsed seconds from `from` to `to`.
inline double seconds_between(Timestamp from, Timestamp to)
{
    return std::chrono::duration<double>(to - from).count();
}

inline Timestamp from_unix_seconds(double seconds)
{
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds)));
}

/// ISO-8601 UTC rendering with millisecond precision, e.g. 2025-12-01T08:30:00.000Z.
std::string to_iso8601(Timestamp t);

} // namespace drivescore::time
