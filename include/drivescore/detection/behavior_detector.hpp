#pragma once

#include <optional>
#include <vector>

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/detection/fuel_waste_model.hpp"
#include "drivescore/state/vehicle_state.hpp"
#include "drivescore/telemetry/sample.hpp"

namespace drivescore::detection {

/// Runs the five behavior rules against one vehicle record.
///
/// Stateless apart from the configuration: every timer, counter and
/// accumulator lives in the VehicleState passed to process(), which the
/// caller must hold exclusively.
class BehaviorDetector {
public:
    explicit BehaviorDetector(const config::BehaviorConfig& config);

    /// Applies the sample gap policy, runs every detector, records the sample
    /// as the vehicle's last-seen values and appends the emitted events to
    /// the vehicle's event log.
    std::vector<BehaviorEvent> process(state::VehicleState& state, const telemetry::TelemetrySample& sample) const;

    [[nodiscard]] const FuelWasteModel& fuel_waste_model() const noexcept { return waste_; }

private:
    struct Tier {
        Severity severity;
        double   threshold;
    };

    config::BehaviorConfig config_;
    FuelWasteModel         waste_;

    [[nodiscard]] std::optional<Tier> classify_acceleration(double rate) const;
    [[nodiscard]] std::optional<Tier> classify_braking(double rate) const;
    [[nodiscard]] Severity            overspeed_severity(double speed_mph) const;

    void detect_device_events(state::VehicleState&              state,
                              const telemetry::TelemetrySample& sample,
                              std::vector<BehaviorEvent>&       events) const;
    void detect_speed_change(state::VehicleState&              state,
                             const telemetry::TelemetrySample& sample,
                             double                            dt,
                             std::vector<BehaviorEvent>&       events) const;
    void detect_excessive_rpm(state::VehicleState&              state,
                              const telemetry::TelemetrySample& sample,
                              double                            dt,
                              std::vector<BehaviorEvent>&       events) const;
    void detect_wrong_gear(state::VehicleState&              state,
                           const telemetry::TelemetrySample& sample,
                           double                            dt,
                           std::vector<BehaviorEvent>&       events) const;
    void detect_overspeeding(state::VehicleState&              state,
                             const telemetry::TelemetrySample& sample,
                             double                            dt,
                             std::vector<BehaviorEvent>&       events) const;

    static void record_mpg(state::VehicleState& state, const telemetry::TelemetrySample& sample);
    static void remember(state::VehicleState& state, const telemetry::TelemetrySample& sample);
};

} // namespace drivescore::detection
