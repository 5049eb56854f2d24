#include "drivescore/detection/behavior_detector.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace drivescore::detection {

namespace {

BehaviorEvent make_event(const telemetry::TelemetrySample& sample,
                         BehaviorCategory                  category,
                         Severity                          severity,
                         double                            value,
                         double                            threshold)
{
    BehaviorEvent event;
    event.vehicle_id = sample.vehicle_id;
    event.timestamp  = sample.timestamp;
    event.category   = category;
    event.severity   = severity;
    event.value      = value;
    event.threshold  = threshold;
    return event;
}

std::string format_message(double value, int precision, const char* text)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value << text;
    return oss.str();
}

} // namespace

BehaviorDetector::BehaviorDetector(const config::BehaviorConfig& config)
    : config_(config)
    , waste_(config.fuel_waste, config.speed.fuel_baseline_mph)
{
    config_.validate();
}

std::vector<BehaviorEvent> BehaviorDetector::process(state::VehicleState&              state,
                                                     const telemetry::TelemetrySample& sample) const
{
    double dt = 0.0;
    if (state.last_time) {
        dt = time::seconds_between(*state.last_time, sample.timestamp);
        if (dt > config_.gap.max_dt_s || dt < config_.gap.min_dt_s) {
            remember(state, sample);
            return {};
        }
    }

    std::vector<BehaviorEvent> events;
    detect_device_events(state, sample, events);
    detect_speed_change(state, sample, dt, events);
    detect_excessive_rpm(state, sample, dt, events);
    detect_wrong_gear(state, sample, dt, events);
    detect_overspeeding(state, sample, dt, events);

    record_mpg(state, sample);
    remember(state, sample);
    for (const auto& event : events) {
        state.events.push(event);
    }
    return events;
}

std::optional<BehaviorDetector::Tier> BehaviorDetector::classify_acceleration(double rate) const
{
    const auto& bands = config_.acceleration;
    if (rate >= bands.severe) {
        return Tier{Severity::Severe, bands.severe};
    }
    if (rate >= bands.moderate) {
        return Tier{Severity::Moderate, bands.moderate};
    }
    if (rate >= bands.minor) {
        return Tier{Severity::Minor, bands.minor};
    }
    return std::nullopt;
}

std::optional<BehaviorDetector::Tier> BehaviorDetector::classify_braking(double rate) const
{
    const auto& bands = config_.braking;
    if (rate <= bands.severe) {
        return Tier{Severity::Severe, bands.severe};
    }
    if (rate <= bands.moderate) {
        return Tier{Severity::Moderate, bands.moderate};
    }
    if (rate <= bands.minor) {
        return Tier{Severity::Minor, bands.minor};
    }
    return std::nullopt;
}

Severity BehaviorDetector::overspeed_severity(double speed_mph) const
{
    if (speed_mph >= config_.speed.severe) {
        return Severity::Severe;
    }
    if (speed_mph >= config_.speed.excessive) {
        return Severity::Moderate;
    }
    return Severity::Minor;
}

void BehaviorDetector::detect_device_events(state::VehicleState&              state,
                                            const telemetry::TelemetrySample& sample,
                                            std::vector<BehaviorEvent>&       events) const
{
    const auto emit = [&](BehaviorCategory category, int count, double reference_mg, int& counter) {
        const double gallons = waste_.device_events(category, count);

        auto event                 = make_event(sample, category, Severity::Moderate, reference_mg, reference_mg);
        event.fuel_waste_gal       = gallons;
        event.context.source       = EventSource::Device;
        event.context.device_count = count;
        event.context.unit         = "mg";

        counter += count;
        state.fuel_waste[category] += gallons;
        events.push_back(std::move(event));
    };

    if (const int count = sample.device_harsh_accel.value_or(0); count > 0) {
        emit(BehaviorCategory::HardAcceleration, count, config_.device.harsh_accel_mg,
             state.counters.hard_accel_count);
    }
    if (const int count = sample.device_harsh_brake.value_or(0); count > 0) {
        emit(BehaviorCategory::HardBraking, count, config_.device.harsh_brake_mg, state.counters.hard_brake_count);
    }
}

void BehaviorDetector::detect_speed_change(state::VehicleState&              state,
                                           const telemetry::TelemetrySample& sample,
                                           double                            dt,
                                           std::vector<BehaviorEvent>&       events) const
{
    if (!sample.speed_mph || !state.last_speed || dt <= 0.0) {
        return;
    }

    const double rate = (*sample.speed_mph - *state.last_speed) / dt;

    const auto emit = [&](BehaviorCategory category, const Tier& tier, int& counter) {
        // Braking is reported as positive magnitudes.
        const double gallons = waste_.per_event(category, tier.severity);

        auto event              = make_event(sample, category, tier.severity, std::abs(rate), std::abs(tier.threshold));
        event.fuel_waste_gal    = gallons;
        event.context.speed_mph = sample.speed_mph;
        event.context.unit      = "mph/s";

        ++counter;
        state.fuel_waste[category] += gallons;
        events.push_back(std::move(event));
    };

    if (sample.device_harsh_accel.value_or(0) == 0) {
        if (const auto tier = classify_acceleration(rate)) {
            emit(BehaviorCategory::HardAcceleration, *tier, state.counters.hard_accel_count);
        }
    }
    if (sample.device_harsh_brake.value_or(0) == 0) {
        if (const auto tier = classify_braking(rate)) {
            emit(BehaviorCategory::HardBraking, *tier, state.counters.hard_brake_count);
        }
    }
}

void BehaviorDetector::detect_excessive_rpm(state::VehicleState&              state,
                                            const telemetry::TelemetrySample& sample,
                                            double                            dt,
                                            std::vector<BehaviorEvent>&       events) const
{
    if (!sample.rpm || *sample.rpm <= 0.0) {
        return;
    }

    const double rpm       = *sample.rpm;
    const auto&  bands     = config_.rpm;
    auto&        condition = state.high_rpm;
    if (rpm < bands.excessive) {
        condition.deactivate();
        return;
    }

    condition.activate(sample.timestamp);
    const double duration = condition.duration_s(sample.timestamp);
    state.counters.high_rpm_seconds += dt;
    state.fuel_waste[BehaviorCategory::ExcessiveRpm] += waste_.sustained(BehaviorCategory::ExcessiveRpm, dt);

    const auto emit = [&](Severity severity, double threshold) {
        auto event            = make_event(sample, BehaviorCategory::ExcessiveRpm, severity, rpm, threshold);
        event.duration_s      = duration;
        event.fuel_waste_gal  = waste_.sustained(BehaviorCategory::ExcessiveRpm, duration);
        event.context.gear    = sample.gear;
        event.context.unit    = "rpm";
        event.context.message = format_message(duration, 0, "s above excessive RPM");
        events.push_back(std::move(event));
    };

    if (!condition.critical_reported && duration >= bands.critical_seconds && rpm >= bands.redline) {
        emit(Severity::Critical, bands.redline);
        condition.critical_reported = true;
        condition.reported          = true;
    } else if (!condition.reported && duration >= bands.sustained_seconds) {
        emit(rpm >= bands.redline ? Severity::Severe : Severity::Moderate, bands.excessive);
        condition.reported = true;
    }
}

void BehaviorDetector::detect_wrong_gear(state::VehicleState&              state,
                                         const telemetry::TelemetrySample& sample,
                                         double                            dt,
                                         std::vector<BehaviorEvent>&       events) const
{
    if (!sample.rpm || !sample.gear || !sample.speed_mph) {
        return;
    }

    const auto& rules     = config_.wrong_gear;
    auto&       condition = state.wrong_gear;
    const bool  lugging_low_gear =
        *sample.rpm >= rules.rpm_threshold && *sample.gear < state.max_gear && *sample.speed_mph > rules.min_speed_mph;
    if (!lugging_low_gear) {
        condition.deactivate();
        return;
    }

    condition.activate(sample.timestamp);
    const double duration = condition.duration_s(sample.timestamp);
    state.counters.wrong_gear_seconds += dt;
    state.fuel_waste[BehaviorCategory::WrongGear] += waste_.sustained(BehaviorCategory::WrongGear, dt);

    if (condition.reported || duration < rules.min_duration_s) {
        return;
    }

    auto event = make_event(sample, BehaviorCategory::WrongGear, Severity::Moderate, *sample.rpm, rules.rpm_threshold);
    event.duration_s        = duration;
    event.fuel_waste_gal    = waste_.sustained(BehaviorCategory::WrongGear, duration);
    event.context.gear      = sample.gear;
    event.context.speed_mph = sample.speed_mph;
    event.context.unit      = "rpm";

    std::ostringstream oss;
    oss << "RPM " << std::lround(*sample.rpm) << " in gear " << *sample.gear << " of " << state.max_gear
        << ", could upshift";
    event.context.message = oss.str();

    condition.reported = true;
    events.push_back(std::move(event));
}

void BehaviorDetector::detect_overspeeding(state::VehicleState&              state,
                                           const telemetry::TelemetrySample& sample,
                                           double                            dt,
                                           std::vector<BehaviorEvent>&       events) const
{
    if (!sample.speed_mph) {
        return;
    }

    const double speed     = *sample.speed_mph;
    const auto&  bands     = config_.speed;
    auto&        condition = state.overspeeding;
    if (speed < bands.warning) {
        condition.deactivate();
        return;
    }

    condition.activate(sample.timestamp);
    const double duration = condition.duration_s(sample.timestamp);
    state.counters.overspeeding_seconds += dt;
    state.fuel_waste[BehaviorCategory::Overspeeding] += waste_.sustained(BehaviorCategory::Overspeeding, dt, speed);

    if (condition.reported || duration < bands.sustained_seconds) {
        return;
    }

    auto event = make_event(sample, BehaviorCategory::Overspeeding, overspeed_severity(speed), speed, bands.warning);
    event.duration_s        = duration;
    event.fuel_waste_gal    = waste_.sustained(BehaviorCategory::Overspeeding, duration, speed);
    event.context.speed_mph = speed;
    event.context.mph_over  = waste_.mph_over_baseline(speed);
    event.context.unit      = "mph";
    event.context.message   = format_message(duration, 0, "s above the speed warning");

    condition.reported = true;
    events.push_back(std::move(event));
}

void BehaviorDetector::record_mpg(state::VehicleState& state, const telemetry::TelemetrySample& sample)
{
    if (sample.kalman_mpg && *sample.kalman_mpg > 0.0) {
        state.kalman_mpg.push(*sample.kalman_mpg);
    }
    if (sample.ecu_mpg && *sample.ecu_mpg > 0.0) {
        state.ecu_mpg.push(*sample.ecu_mpg);
    }
}

void BehaviorDetector::remember(state::VehicleState& state, const telemetry::TelemetrySample& sample)
{
    state.last_speed = sample.speed_mph;
    state.last_rpm   = sample.rpm;
    state.last_gear  = sample.gear;
    state.last_time  = sample.timestamp;
}

} // namespace drivescore::detection
