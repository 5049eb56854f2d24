#include "drivescore/fleet/fleet_summary.hpp"

#include <algorithm>
#include <sstream>

namespace drivescore::fleet {

namespace {

using detection::BehaviorCategory;

// Points lost per average occurrence (or minute) per vehicle.
constexpr double kFleetAccelFactor     = 8.0;
constexpr double kFleetBrakeFactor     = 6.0;
constexpr double kFleetRpmFactor       = 2.0;
constexpr double kFleetGearFactor      = 1.5;
constexpr double kFleetOverspeedFactor = 1.0;

double clamp_percent(double value)
{
    return std::clamp(value, 0.0, 100.0);
}

} // namespace

FleetAggregator::FleetAggregator(const config::BehaviorConfig& config)
    : FleetAggregator(config, Params{})
{
}

FleetAggregator::FleetAggregator(const config::BehaviorConfig& config, Params params)
    : config_(config)
    , params_(params)
{
}

std::optional<FleetSummary> FleetAggregator::summarize(std::vector<scoring::HeavyFootScore> scores) const
{
    if (scores.empty()) {
        return std::nullopt;
    }

    std::stable_sort(scores.begin(), scores.end(), [](const auto& a, const auto& b) { return a.overall < b.overall; });

    FleetSummary summary;
    summary.fleet_size = scores.size();

    double score_sum   = 0.0;
    double accel_sum   = 0.0;
    double brake_sum   = 0.0;
    double rpm_minutes = 0.0;
    double speed_mins  = 0.0;
    for (const auto& score : scores) {
        score_sum += score.overall;
        accel_sum += score.hard_accel_count;
        brake_sum += score.hard_brake_count;
        rpm_minutes += score.high_rpm_minutes;
        speed_mins += score.overspeeding_minutes;
        for (const auto category : detection::kAllBehaviorCategories) {
            summary.fuel_waste[category] += score.fuel_waste[category];
        }
        if (score.overall < params_.needs_work_below) {
            ++summary.needs_work_count;
        }
    }

    const auto n                 = static_cast<double>(scores.size());
    summary.average_score        = score_sum / n;
    summary.total_fuel_waste_gal = summary.fuel_waste.total();
    summary.biggest_issue        = summary.fuel_waste.largest();
    summary.biggest_issue_gal    = summary.fuel_waste[summary.biggest_issue];

    // Gear usage is approximated from high-RPM time; wrong-gear time is not
    // reported uniformly across vehicle types.
    auto& behavior = summary.behavior_scores;
    behavior[static_cast<std::size_t>(BehaviorCategory::HardAcceleration)] =
        clamp_percent(100.0 - accel_sum / n * kFleetAccelFactor);
    behavior[static_cast<std::size_t>(BehaviorCategory::HardBraking)] =
        clamp_percent(100.0 - brake_sum / n * kFleetBrakeFactor);
    behavior[static_cast<std::size_t>(BehaviorCategory::ExcessiveRpm)] =
        clamp_percent(100.0 - rpm_minutes / n * kFleetRpmFactor);
    behavior[static_cast<std::size_t>(BehaviorCategory::WrongGear)] =
        clamp_percent(100.0 - rpm_minutes / n * kFleetGearFactor);
    behavior[static_cast<std::size_t>(BehaviorCategory::Overspeeding)] =
        clamp_percent(100.0 - speed_mins / n * kFleetOverspeedFactor);

    const std::size_t ranked = std::min(params_.ranking_size, scores.size());
    summary.worst.assign(scores.begin(), scores.begin() + static_cast<std::ptrdiff_t>(ranked));
    summary.best.assign(scores.rbegin(), scores.rbegin() + static_cast<std::ptrdiff_t>(ranked));

    summary.recommendations = recommendations(summary, scores);
    return summary;
}

std::string FleetAggregator::category_recommendation(BehaviorCategory category) const
{
    std::ostringstream oss;
    switch (category) {
        case BehaviorCategory::HardAcceleration:
            oss << "Hard acceleration is primary fuel waste source - train drivers on smooth acceleration";
            break;
        case BehaviorCategory::HardBraking:
            oss << "Frequent hard braking detected - encourage anticipatory driving";
            break;
        case BehaviorCategory::ExcessiveRpm:
            oss << "High RPM operation is wasting fuel - train drivers on optimal RPM range (" << config_.rpm.optimal_min
                << "-" << config_.rpm.optimal_max << ")";
            break;
        case BehaviorCategory::WrongGear:
            oss << "Wrong gear usage detected - drivers should upshift earlier to stay in torque band";
            break;
        case BehaviorCategory::Overspeeding:
            oss << "Overspeeding is wasting fuel - each mph above " << config_.speed.fuel_baseline_mph
                << " reduces efficiency by ~0.1 MPG";
            break;
    }
    return oss.str();
}

std::vector<std::string> FleetAggregator::recommendations(const FleetSummary&                         summary,
                                                          const std::vector<scoring::HeavyFootScore>& ascending) const
{
    std::vector<std::string> out;

    if (summary.average_score < params_.training_below) {
        std::ostringstream oss;
        oss << "Fleet average score is below " << params_.training_below << " - consider driver training program";
        out.push_back(oss.str());
    }

    if (summary.biggest_issue_gal > 0.0) {
        out.push_back(category_recommendation(summary.biggest_issue));
    }

    std::vector<std::string> urgent;
    for (const auto& score : ascending) {
        if (score.overall < params_.immediate_below) {
            urgent.push_back(score.vehicle_id);
        }
    }
    if (!urgent.empty()) {
        std::ostringstream oss;
        oss << urgent.size() << " vehicles need immediate attention: ";
        const std::size_t listed = std::min(urgent.size(), params_.max_listed_vehicles);
        for (std::size_t i = 0; i < listed; ++i) {
            oss << (i == 0 ? "" : ", ") << urgent[i];
        }
        out.push_back(oss.str());
    }
    return out;
}

} // namespace drivescore::fleet
