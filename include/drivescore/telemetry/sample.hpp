#pragma once

#include <optional>
#include <string>

#include "drivescore/common/time.hpp"

namespace drivescore::telemetry {

/// One periodic reading for a vehicle. Every signal is independently optional;
/// a missing signal only disables the detectors that need it.
struct TelemetrySample {
    std::string     vehicle_id{};
    time::Timestamp timestamp{};

    std::optional<double> speed_mph{};
    std::optional<double> rpm{};
    std::optional<int>    gear{};
    std::optional<double> fuel_rate_gph{};
    std::optional<double> ecu_mpg{};    // ECU-reported fuel economy
    std::optional<double> kalman_mpg{}; // Kalman-filtered estimate
    std::optional<bool>   brake_switch{};
    std::optional<double> brake_pressure_psi{};
    std::optional<int>    device_harsh_accel{};
    std::optional<int>    device_harsh_brake{};

    /// Throws errors::InputError for an empty vehicle id, non-finite values,
    /// a gear below 1 or a negative device count.
    void validate() const;
};

} // namespace drivescore::telemetry
