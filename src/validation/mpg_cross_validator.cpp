#include "drivescore/validation/mpg_cross_validator.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace drivescore::validation {

namespace {

double mean(const common::RingBuffer<double>& window)
{
    double sum = 0.0;
    for (std::size_t i = 0; i < window.size(); ++i) {
        sum += window[i];
    }
    return sum / static_cast<double>(window.size());
}

} // namespace

MpgCrossValidator::MpgCrossValidator(const config::CrossValidationConfig& config)
    : config_(config)
{
    config_.validate();
}

std::optional<MpgCrossValidation> MpgCrossValidator::validate(const state::VehicleState& state) const
{
    if (state.kalman_mpg.size() < config_.min_samples || state.ecu_mpg.size() < config_.min_samples) {
        return std::nullopt;
    }

    const double kalman = mean(state.kalman_mpg);
    const double ecu    = mean(state.ecu_mpg);
    if (ecu <= 0.0) {
        return std::nullopt;
    }

    MpgCrossValidation result;
    result.vehicle_id     = state.vehicle_id;
    result.timestamp      = state.last_time.value_or(time::Clock::now());
    result.kalman_mpg_avg = kalman;
    result.ecu_mpg_avg    = ecu;
    result.difference_pct = std::abs(kalman - ecu) / ecu * 100.0;
    result.is_valid       = result.difference_pct <= config_.tolerance_pct;

    if (result.is_valid) {
        result.recommendation = "MPG validated - Kalman estimate matches ECU";
    } else {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << "Kalman MPG " << result.difference_pct << "% ";
        if (kalman > ecu) {
            oss << "higher than ECU - may be overestimating";
        } else {
            oss << "lower than ECU - may be underestimating";
        }
        result.recommendation = oss.str();
    }
    return result;
}

} // namespace drivescore::validation
