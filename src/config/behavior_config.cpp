#include "drivescore/config/behavior_config.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <string_view>

#include "drivescore/common/errors.hpp"

namespace drivescore::config {

namespace {

::drivescore::errors::ConfigError field_error(std::string_view section, std::string_view field, std::string_view msg)
{
    std::ostringstream key;
    key << section << "." << field;
    return ::drivescore::errors::ConfigError(DRIVESCORE_LOC(std::string(msg)), key.str());
}

void require_positive(double value, std::string_view section, std::string_view field)
{
    if (!std::isfinite(value) || value <= 0.0) {
        throw field_error(section, field, "must be positive");
    }
}

void require_non_negative(double value, std::string_view section, std::string_view field)
{
    if (!std::isfinite(value) || value < 0.0) {
        throw field_error(section, field, "must be non-negative");
    }
}

void validate_acceleration(const RateBands& bands)
{
    require_positive(bands.minor, "acceleration", "minor");
    if (!(bands.moderate > bands.minor)) {
        throw field_error("acceleration", "moderate", "must be greater than minor");
    }
    if (!(bands.severe > bands.moderate)) {
        throw field_error("acceleration", "severe", "must be greater than moderate");
    }
}

void validate_braking(const RateBands& bands)
{
    if (!std::isfinite(bands.minor) || bands.minor >= 0.0) {
        throw field_error("braking", "minor", "must be negative");
    }
    if (!(bands.moderate < bands.minor)) {
        throw field_error("braking", "moderate", "must be below minor");
    }
    if (!(bands.severe < bands.moderate)) {
        throw field_error("braking", "severe", "must be below moderate");
    }
}

} // namespace

void RpmBands::validate() const
{
    if (optimal_min <= 0) {
        throw field_error("rpm", "optimal_min", "must be positive");
    }
    if (optimal_max < optimal_min) {
        throw field_error("rpm", "optimal_max", "must be >= optimal_min");
    }
    if (high_warning < optimal_max) {
        throw field_error("rpm", "high_warning", "must be >= optimal_max");
    }
    if (excessive < high_warning) {
        throw field_error("rpm", "excessive", "must be >= high_warning");
    }
    if (redline < excessive) {
        throw field_error("rpm", "redline", "must be >= excessive");
    }
    require_positive(sustained_seconds, "rpm", "sustained_seconds");
    if (critical_seconds < sustained_seconds) {
        throw field_error("rpm", "critical_seconds", "must be >= sustained_seconds");
    }
}

void WrongGearConfig::validate() const
{
    if (rpm_threshold <= 0) {
        throw field_error("wrong_gear", "rpm_threshold", "must be positive");
    }
    require_non_negative(min_duration_s, "wrong_gear", "min_duration_s");
    require_non_negative(min_speed_mph, "wrong_gear", "min_speed_mph");
    if (default_max_gear < 1) {
        throw field_error("wrong_gear", "default_max_gear", "must be at least 1");
    }
    for (const auto& [name, max_gear] : vehicle_types) {
        if (name.empty()) {
            throw field_error("wrong_gear", "vehicle_types", "must not contain an empty type name");
        }
        if (max_gear < 1) {
            throw field_error("wrong_gear.vehicle_types", name, "must be at least 1");
        }
    }
}

void SpeedBands::validate() const
{
    require_positive(warning, "speed", "warning");
    if (excessive < warning) {
        throw field_error("speed", "excessive", "must be >= warning");
    }
    if (severe < excessive) {
        throw field_error("speed", "severe", "must be >= excessive");
    }
    require_non_negative(sustained_seconds, "speed", "sustained_seconds");
    require_non_negative(fuel_baseline_mph, "speed", "fuel_baseline_mph");
}

void FuelWasteCoefficients::validate() const
{
    require_non_negative(hard_accel_gal, "fuel_waste", "hard_accel_gal");
    require_non_negative(hard_brake_gal, "fuel_waste", "hard_brake_gal");
    require_non_negative(high_rpm_gal_per_min, "fuel_waste", "high_rpm_gal_per_min");
    require_non_negative(wrong_gear_gal_per_min, "fuel_waste", "wrong_gear_gal_per_min");
    require_non_negative(overspeed_gal_per_min_per_mph, "fuel_waste", "overspeed_gal_per_min_per_mph");
}

void SampleGapPolicy::validate() const
{
    require_non_negative(min_dt_s, "gap", "min_dt_s");
    if (!std::isfinite(max_dt_s) || max_dt_s <= min_dt_s) {
        throw field_error("gap", "max_dt_s", "must be greater than min_dt_s");
    }
}

void CrossValidationConfig::validate() const
{
    require_non_negative(tolerance_pct, "cross_validation", "tolerance_pct");
    if (window == 0) {
        throw field_error("cross_validation", "window", "must be positive");
    }
    if (min_samples == 0 || min_samples > window) {
        throw field_error("cross_validation", "min_samples", "must be in [1, window]");
    }
}

void BehaviorConfig::validate() const
{
    validate_acceleration(acceleration);
    validate_braking(braking);
    rpm.validate();
    wrong_gear.validate();
    speed.validate();
    fuel_waste.validate();
    gap.validate();
    cross_validation.validate();
    require_positive(device.harsh_accel_mg, "device", "harsh_accel_mg");
    require_positive(device.harsh_brake_mg, "device", "harsh_brake_mg");
    if (event_log_capacity == 0) {
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC("must be positive"), "event_log_capacity");
    }
}

int BehaviorConfig::max_gear_for(const std::string& vehicle_type) const
{
    const auto it = wrong_gear.vehicle_types.find(vehicle_type);
    if (it == wrong_gear.vehicle_types.end()) {
        std::ostringstream oss;
        oss << "Unknown vehicle type '" << vehicle_type << "'";
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()));
    }
    return it->second;
}

} // namespace drivescore::config
