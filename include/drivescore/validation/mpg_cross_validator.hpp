#pragma once

#include <optional>
#include <string>

#include "drivescore/common/time.hpp"
#include "drivescore/config/behavior_config.hpp"
#include "drivescore/state/vehicle_state.hpp"

namespace drivescore::validation {

struct MpgCrossValidation {
    std::string     vehicle_id{};
    time::Timestamp timestamp{};
    double          kalman_mpg_avg = 0.0;
    double          ecu_mpg_avg    = 0.0;
    double          difference_pct = 0.0;
    bool            is_valid       = false;
    std::string     recommendation{};
};

/// Compares the recent Kalman-filtered MPG estimates against the ECU reading.
class MpgCrossValidator {
public:
    explicit MpgCrossValidator(const config::CrossValidationConfig& config);

    /// Returns std::nullopt until both windows hold `min_samples` values, or
    /// when the ECU mean is not positive.
    [[nodiscard]] std::optional<MpgCrossValidation> validate(const state::VehicleState& state) const;

private:
    config::CrossValidationConfig config_;
};

} // namespace drivescore::validation
