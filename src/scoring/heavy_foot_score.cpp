#include "drivescore/scoring/heavy_foot_score.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "drivescore/common/errors.hpp"

namespace drivescore::scoring {

namespace {

constexpr double kDrivingShareOfPeriod = 0.4;
constexpr double kMinutesEpsilon       = 1e-6;

constexpr double kExpectedAccelPerHour = 2.0;
constexpr double kAccelPenalty         = 3.0;
constexpr double kExpectedBrakePerHour = 3.0;
constexpr double kBrakePenalty         = 2.0;
constexpr double kAllowedHighRpmPct    = 10.0;
constexpr double kHighRpmPenalty       = 3.0;
constexpr double kAllowedWrongGearPct  = 5.0;
constexpr double kWrongGearPenalty     = 4.0;
constexpr double kAllowedOverspeedPct  = 5.0;
constexpr double kOverspeedPenalty     = 3.0;

double clamp_score(double penalty)
{
    return std::max(0.0, 100.0 - penalty);
}

double count_score(int count, double expected, double factor)
{
    return clamp_score(std::max(0.0, static_cast<double>(count) - expected) * factor);
}

double share_score(double minutes, double driving_minutes, double allowed_pct, double factor)
{
    const double pct = minutes / std::max(driving_minutes, kMinutesEpsilon) * 100.0;
    return clamp_score(std::max(0.0, pct - allowed_pct) * factor);
}

void require_finite(double value, const char* name, const std::string& vehicle_id)
{
    if (!std::isfinite(value)) {
        std::ostringstream oss;
        oss << name << " must be finite; got " << value;
        throw ::drivescore::errors::InputError(DRIVESCORE_LOC(oss.str()), vehicle_id);
    }
}

} // namespace

double SubScores::operator[](detection::BehaviorCategory category) const
{
    using detection::BehaviorCategory;
    switch (category) {
        case BehaviorCategory::HardAcceleration: return acceleration;
        case BehaviorCategory::HardBraking: return braking;
        case BehaviorCategory::ExcessiveRpm: return rpm;
        case BehaviorCategory::WrongGear: return gear;
        case BehaviorCategory::Overspeeding: return speed;
    }
    return 0.0;
}

char grade_for(double overall)
{
    if (overall >= 90.0) {
        return 'A';
    }
    if (overall >= 80.0) {
        return 'B';
    }
    if (overall >= 70.0) {
        return 'C';
    }
    if (overall >= 60.0) {
        return 'D';
    }
    return 'F';
}

double HeavyFootScorer::overall(const SubScores& s, const ScoreWeights& w)
{
    return s.acceleration * w.acceleration + s.braking * w.braking + s.rpm * w.rpm + s.gear * w.gear
           + s.speed * w.speed;
}

HeavyFootScore HeavyFootScorer::score(const state::VehicleState& state,
                                      double                     period_hours,
                                      std::optional<double>      driving_hours)
{
    require_finite(period_hours, "period_hours", state.vehicle_id);
    if (driving_hours) {
        require_finite(*driving_hours, "driving_hours", state.vehicle_id);
    }

    HeavyFootScore result;
    result.vehicle_id    = state.vehicle_id;
    result.timestamp     = state.last_time.value_or(time::Clock::now());
    result.period_hours  = period_hours;
    result.driving_hours = driving_hours.value_or(std::max(1.0, period_hours * kDrivingShareOfPeriod));

    const auto& counters        = state.counters;
    result.hard_accel_count     = counters.hard_accel_count;
    result.hard_brake_count     = counters.hard_brake_count;
    result.high_rpm_minutes     = counters.high_rpm_seconds / 60.0;
    result.wrong_gear_minutes   = counters.wrong_gear_seconds / 60.0;
    result.overspeeding_minutes = counters.overspeeding_seconds / 60.0;

    const double hours           = std::max(result.driving_hours, 0.0);
    const double driving_minutes = hours * 60.0;

    auto& sub        = result.sub_scores;
    sub.acceleration = count_score(counters.hard_accel_count, hours * kExpectedAccelPerHour, kAccelPenalty);
    sub.braking      = count_score(counters.hard_brake_count, hours * kExpectedBrakePerHour, kBrakePenalty);
    sub.rpm          = share_score(result.high_rpm_minutes, driving_minutes, kAllowedHighRpmPct, kHighRpmPenalty);
    sub.speed = share_score(result.overspeeding_minutes, driving_minutes, kAllowedOverspeedPct, kOverspeedPenalty);
    // A vehicle that never lugged in a low gear keeps a perfect gear score.
    sub.gear = counters.wrong_gear_seconds > 0.0
                   ? share_score(result.wrong_gear_minutes, driving_minutes, kAllowedWrongGearPct, kWrongGearPenalty)
                   : 100.0;

    result.overall              = overall(sub);
    result.grade                = grade_for(result.overall);
    result.fuel_waste           = state.fuel_waste;
    result.total_fuel_waste_gal = state.fuel_waste.total();
    return result;
}

} // namespace drivescore::scoring
