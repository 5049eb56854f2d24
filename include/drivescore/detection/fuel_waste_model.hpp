#pragma once

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/detection/behavior_event.hpp"

namespace drivescore::detection {

/// Converts detected behavior into estimated gallons of wasted fuel.
class FuelWasteModel {
public:
    FuelWasteModel(const config::FuelWasteCoefficients& coefficients, double overspeed_baseline_mph);

    /// Gallons charged for one computed harsh event: severe 2x, moderate 1x,
    /// minor 0.5x the category coefficient. Zero for sustained categories.
    [[nodiscard]] double per_event(BehaviorCategory category, Severity severity) const;

    /// Gallons charged for `count` device-reported harsh events.
    [[nodiscard]] double device_events(BehaviorCategory category, int count) const;

    /// Gallons charged for `seconds` spent in a sustained condition.
    /// Overspeeding additionally scales with mph above the baseline.
    [[nodiscard]] double sustained(BehaviorCategory category, double seconds, double speed_mph = 0.0) const;

    [[nodiscard]] double mph_over_baseline(double speed_mph) const;

private:
    config::FuelWasteCoefficients coefficients_;
    double                        overspeed_baseline_mph_;

    [[nodiscard]] double base_per_event(BehaviorCategory category) const;
};

} // namespace drivescore::detection
