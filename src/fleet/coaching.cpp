#include "drivescore/fleet/coaching.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace drivescore::fleet {

namespace {

using detection::BehaviorCategory;

constexpr double kTipBelowScore    = 85.0;
constexpr double kGradeTipPriority = 5.0;

std::string category_message(BehaviorCategory               category,
                             TipTier                        tier,
                             const scoring::HeavyFootScore& score,
                             const config::BehaviorConfig&  config)
{
    const auto& rpm   = config.rpm;
    const auto& speed = config.speed;

    std::ostringstream oss;
    oss << std::fixed;
    switch (category) {
        case BehaviorCategory::HardAcceleration:
            if (tier == TipTier::Mild) {
                oss << "Accelerate smoothly over 10-15 seconds to improve fuel economy by up to 10%.";
            } else if (tier == TipTier::Moderate) {
                oss << "Your " << score.hard_accel_count
                    << " hard accelerations add up. Try pretending there's an egg under the pedal.";
            } else {
                oss << "Aggressive acceleration detected. Today: ~" << std::setprecision(2)
                    << score.fuel_waste[category] << " gal lost.";
            }
            break;
        case BehaviorCategory::HardBraking:
            if (tier == TipTier::Mild) {
                oss << "Anticipate stops by coasting. Looking further ahead saves brakes AND fuel.";
            } else if (tier == TipTier::Moderate) {
                oss << "Hard braking wastes momentum. " << score.hard_brake_count << " hard stops so far today.";
            } else {
                oss << "Frequent hard braking detected. This indicates late reaction or tailgating. Safety concern.";
            }
            break;
        case BehaviorCategory::ExcessiveRpm:
            if (tier == TipTier::Mild) {
                oss << "Sweet spot is " << rpm.optimal_min << "-" << rpm.optimal_max
                    << " RPM. Your engine's peak torque = best efficiency.";
            } else if (tier == TipTier::Moderate) {
                oss << std::setprecision(0) << score.high_rpm_minutes
                    << " minutes at high RPM. Upshift earlier to save fuel.";
            } else {
                oss << "Excessive RPM burning fuel fast. Today: ~" << std::setprecision(2)
                    << score.fuel_waste[category] << " gal extra.";
            }
            break;
        case BehaviorCategory::WrongGear:
            if (tier == TipTier::Mild) {
                oss << "Match RPM to speed. If RPM is high and you can upshift, do it!";
            } else if (tier == TipTier::Moderate) {
                oss << "Wrong gear detected " << std::setprecision(0) << score.wrong_gear_minutes
                    << "+ minutes. Upshifting earlier saves fuel every minute.";
            } else {
                oss << "Significant wrong gear usage. This is costing ~" << std::setprecision(2)
                    << score.fuel_waste[category] << " gal/day in extra fuel.";
            }
            break;
        case BehaviorCategory::Overspeeding:
            if (tier == TipTier::Mild) {
                oss << std::setprecision(0) << speed.fuel_baseline_mph
                    << " mph = optimal. Each mph above reduces efficiency by ~0.1 MPG.";
            } else if (tier == TipTier::Moderate) {
                oss << std::setprecision(0) << score.overspeeding_minutes
                    << " minutes above the speed warning today. Slowing to " << speed.fuel_baseline_mph
                    << " saves fuel.";
            } else {
                oss << std::setprecision(0) << "Speed consistently above " << speed.excessive
                    << " mph. Fuel economy drops ~15% compared to " << speed.fuel_baseline_mph << " mph.";
            }
            break;
    }
    return oss.str();
}

std::string grade_message(char grade)
{
    switch (grade) {
        case 'A': return "Grade A - Excellent driver! Share your techniques with the team.";
        case 'B': return "Grade B - Good performance. Small tweaks can push you to A level.";
        case 'C': return "Grade C - Room for improvement. Focus on your biggest issue first.";
        case 'D': return "Grade D - Needs attention. Let's schedule a coaching session.";
        default: return "Grade F - Urgent improvement needed. Contact your fleet manager.";
    }
}

} // namespace

TipTier tier_for(double sub_score)
{
    if (sub_score >= 80.0) {
        return TipTier::Mild;
    }
    if (sub_score >= 60.0) {
        return TipTier::Moderate;
    }
    return TipTier::Severe;
}

std::vector<CoachingTip> coaching_tips(const scoring::HeavyFootScore& score,
                                       const config::BehaviorConfig&  config,
                                       std::size_t                    max_tips)
{
    std::vector<CoachingTip> tips;
    for (const auto category : detection::kAllBehaviorCategories) {
        const double sub = score.sub_scores[category];
        if (sub >= kTipBelowScore) {
            continue;
        }
        CoachingTip tip;
        tip.category = category;
        tip.tier     = tier_for(sub);
        tip.priority = 100.0 - sub;
        tip.score    = sub;
        tip.message  = category_message(category, tip.tier, score, config);
        tips.push_back(std::move(tip));
    }

    CoachingTip grade_tip;
    grade_tip.priority = kGradeTipPriority;
    grade_tip.score    = score.overall;
    grade_tip.message  = grade_message(score.grade);
    tips.push_back(std::move(grade_tip));

    std::stable_sort(tips.begin(), tips.end(), [](const auto& a, const auto& b) { return a.priority > b.priority; });
    if (tips.size() > max_tips) {
        tips.resize(max_tips);
    }
    return tips;
}

const char* tier_to_string(TipTier tier)
{
    switch (tier) {
        case TipTier::Mild: return "mild";
        case TipTier::Moderate: return "moderate";
        case TipTier::Severe: return "severe";
        case TipTier::Info: return "info";
    }
    return "unknown";
}

} // namespace drivescore::fleet
