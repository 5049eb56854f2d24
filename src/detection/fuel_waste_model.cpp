#include "drivescore/detection/fuel_waste_model.hpp"

#include <algorithm>

namespace drivescore::detection {

namespace {
constexpr double kSecondsPerMinute = 60.0;
}

FuelWasteModel::FuelWasteModel(const config::FuelWasteCoefficients& coefficients, double overspeed_baseline_mph)
    : coefficients_(coefficients)
    , overspeed_baseline_mph_(overspeed_baseline_mph)
{
}

double FuelWasteModel::base_per_event(BehaviorCategory category) const
{
    switch (category) {
        case BehaviorCategory::HardAcceleration: return coefficients_.hard_accel_gal;
        case BehaviorCategory::HardBraking: return coefficients_.hard_brake_gal;
        case BehaviorCategory::ExcessiveRpm:
        case BehaviorCategory::WrongGear:
        case BehaviorCategory::Overspeeding: return 0.0;
    }
    return 0.0;
}

double FuelWasteModel::per_event(BehaviorCategory category, Severity severity) const
{
    const double base = base_per_event(category);
    switch (severity) {
        case Severity::Minor: return base * 0.5;
        case Severity::Moderate: return base;
        case Severity::Severe:
        case Severity::Critical: return base * 2.0;
    }
    return base;
}

double FuelWasteModel::device_events(BehaviorCategory category, int count) const
{
    return base_per_event(category) * static_cast<double>(std::max(count, 0));
}

double FuelWasteModel::sustained(BehaviorCategory category, double seconds, double speed_mph) const
{
    const double minutes = std::max(seconds, 0.0) / kSecondsPerMinute;
    switch (category) {
        case BehaviorCategory::ExcessiveRpm: return minutes * coefficients_.high_rpm_gal_per_min;
        case BehaviorCategory::WrongGear: return minutes * coefficients_.wrong_gear_gal_per_min;
        case BehaviorCategory::Overspeeding:
            return minutes * coefficients_.overspeed_gal_per_min_per_mph * mph_over_baseline(speed_mph);
        case BehaviorCategory::HardAcceleration:
        case BehaviorCategory::HardBraking: return 0.0;
    }
    return 0.0;
}

double FuelWasteModel::mph_over_baseline(double speed_mph) const
{
    return std::max(0.0, speed_mph - overspeed_baseline_mph_);
}

} // namespace drivescore::detection
