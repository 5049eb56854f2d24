#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace drivescore::config {

/// Rate bands in mph per second. Braking bands are negative.
struct RateBands {
    double minor    = 0.0;
    double moderate = 0.0;
    double severe   = 0.0;
};

struct RpmBands {
    int    optimal_min       = 1200;
    int    optimal_max       = 1600;
    int    high_warning      = 1800;
    int    excessive         = 2100;
    int    redline           = 2500;
    double sustained_seconds = 5.0;
    double critical_seconds  = 10.0;

    void validate() const;
};

struct WrongGearConfig {
    int    rpm_threshold    = 1700;
    double min_duration_s   = 5.0;
    double min_speed_mph    = 25.0;
    int    default_max_gear = 13;
    // Vehicle type name -> highest gear of that transmission.
    std::map<std::string, int> vehicle_types{};

    void validate() const;
};

struct SpeedBands {
    double warning           = 65.0;
    double excessive         = 70.0;
    double severe            = 75.0;
    double sustained_seconds = 60.0;
    // Overspeed fuel waste scales with mph above this speed.
    double fuel_baseline_mph = 65.0;

    void validate() const;
};

struct FuelWasteCoefficients {
    double hard_accel_gal                = 0.05;
    double hard_brake_gal                = 0.02;
    double high_rpm_gal_per_min          = 0.02;
    double wrong_gear_gal_per_min        = 0.03;
    double overspeed_gal_per_min_per_mph = 0.01;

    void validate() const;
};

struct SampleGapPolicy {
    double min_dt_s = 1.0;
    double max_dt_s = 300.0;

    void validate() const;
};

struct CrossValidationConfig {
    double      tolerance_pct = 15.0;
    std::size_t window        = 10;
    std::size_t min_samples   = 5;

    void validate() const;
};

/// Reference magnitudes (milli-g) of the accelerometer firmware's harsh-event triggers.
struct DeviceReference {
    double harsh_accel_mg = 280.0;
    double harsh_brake_mg = 320.0;
};

struct BehaviorConfig {
    RateBands             acceleration{3.0, 4.5, 6.0};
    RateBands             braking{-4.0, -6.0, -8.0};
    RpmBands              rpm{};
    WrongGearConfig       wrong_gear{};
    SpeedBands            speed{};
    FuelWasteCoefficients fuel_waste{};
    SampleGapPolicy       gap{};
    CrossValidationConfig cross_validation{};
    DeviceReference       device{};
    std::size_t           event_log_capacity = 512;

    void validate() const;

    /// Max gear for `vehicle_type`; throws ConfigError for an unknown type.
    [[nodiscard]] int max_gear_for(const std::string& vehicle_type) const;
};

} // namespace drivescore::config
