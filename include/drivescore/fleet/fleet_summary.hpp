#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/scoring/heavy_foot_score.hpp"

namespace drivescore::fleet {

struct FleetSummary {
    std::size_t fleet_size       = 0;
    double      average_score    = 0.0;
    std::size_t needs_work_count = 0; // vehicles scoring below 70

    std::vector<scoring::HeavyFootScore> best{};  // highest score first
    std::vector<scoring::HeavyFootScore> worst{}; // lowest score first

    detection::FuelWasteBreakdown fuel_waste{};
    double                        total_fuel_waste_gal = 0.0;
    detection::BehaviorCategory   biggest_issue        = detection::BehaviorCategory::HardAcceleration;
    double                        biggest_issue_gal    = 0.0;

    // Fleet-wide 0-100 score per category, indexed by BehaviorCategory.
    std::array<double, detection::kBehaviorCategoryCount> behavior_scores{};

    std::vector<std::string> recommendations{};
};

/// Ranks a set of vehicle scores and derives fleet-level recommendations.
class FleetAggregator {
public:
    struct Params {
        std::size_t ranking_size        = 3;
        double      needs_work_below    = 70.0;
        double      training_below      = 70.0;
        double      immediate_below     = 50.0;
        std::size_t max_listed_vehicles = 5;
    };

    explicit FleetAggregator(const config::BehaviorConfig& config);
    FleetAggregator(const config::BehaviorConfig& config, Params params);

    /// Returns std::nullopt for an empty fleet.
    [[nodiscard]] std::optional<FleetSummary> summarize(std::vector<scoring::HeavyFootScore> scores) const;

    /// Coaching line for the fleet's dominant waste category.
    [[nodiscard]] std::string category_recommendation(detection::BehaviorCategory category) const;

private:
    config::BehaviorConfig config_;
    Params                 params_;

    [[nodiscard]] std::vector<std::string> recommendations(const FleetSummary&                         summary,
                                                           const std::vector<scoring::HeavyFootScore>& ascending) const;
};

} // namespace drivescore::fleet
