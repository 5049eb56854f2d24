#pragma once

#include <optional>
#include <string>

#include "drivescore/common/time.hpp"
#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/state/vehicle_state.hpp"

namespace drivescore::scoring {

struct SubScores {
    double acceleration = 100.0;
    double braking      = 100.0;
    double rpm          = 100.0;
    double gear         = 100.0;
    double speed        = 100.0;

    [[nodiscard]] double operator[](detection::BehaviorCategory category) const;
};

/// Composite 0-100 driving quality score for one vehicle.
struct HeavyFootScore {
    std::string     vehicle_id{};
    time::Timestamp timestamp{};
    double          period_hours  = 0.0;
    double          driving_hours = 0.0;

    SubScores sub_scores{};
    double    overall = 0.0;
    char      grade   = 'F';

    int    hard_accel_count     = 0;
    int    hard_brake_count     = 0;
    double high_rpm_minutes     = 0.0;
    double wrong_gear_minutes   = 0.0;
    double overspeeding_minutes = 0.0;

    detection::FuelWasteBreakdown fuel_waste{};
    double                        total_fuel_waste_gal = 0.0;
};

struct ScoreWeights {
    double acceleration = 0.30;
    double braking      = 0.20;
    double rpm          = 0.20;
    double gear         = 0.15;
    double speed        = 0.15;
};

/// Letter grade: >=90 A, >=80 B, >=70 C, >=60 D, else F.
char grade_for(double overall);

class HeavyFootScorer {
public:
    /// Scores `state` over a period of `period_hours`. Without `driving_hours`
    /// the vehicle is assumed to drive 40% of the period, at least one hour.
    /// Throws errors::InputError when either duration is not finite.
    [[nodiscard]] static HeavyFootScore score(const state::VehicleState& state,
                                              double                     period_hours,
                                              std::optional<double>      driving_hours = std::nullopt);

    [[nodiscard]] static double overall(const SubScores& sub_scores, const ScoreWeights& weights = ScoreWeights{});
};

} // namespace drivescore::scoring
