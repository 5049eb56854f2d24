#pragma once

#include <optional>
#include <string>

#include "drivescore/common/time.hpp"
#include "drivescore/telemetry/sample.hpp"

namespace drivescore::test {

// 2025-12-01T08:00:00Z
inline constexpr double kTripStartUnix = 1764576000.0;

inline time::Timestamp at(double seconds_into_trip)
{
    return time::from_unix_seconds(kTripStartUnix + seconds_into_trip);
}

inline telemetry::TelemetrySample sample(const std::string&    vehicle_id,
                                         double                seconds_into_trip,
                                         std::optional<double> speed_mph = std::nullopt,
                                         std::optional<double> rpm       = std::nullopt,
                                         std::optional<int>    gear      = std::nullopt)
{
    telemetry::TelemetrySample s{};
    s.vehicle_id = vehicle_id;
    s.timestamp  = at(seconds_into_trip);
    s.speed_mph  = speed_mph;
    s.rpm        = rpm;
    s.gear       = gear;
    return s;
}

} // namespace drivescore::test
