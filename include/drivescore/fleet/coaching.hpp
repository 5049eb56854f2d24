#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/scoring/heavy_foot_score.hpp"

namespace drivescore::fleet {

enum class TipTier
{
    Mild,
    Moderate,
    Severe,
    Info
};

struct CoachingTip {
    // Empty for the overall-grade tip.
    std::optional<detection::BehaviorCategory> category{};
    TipTier                                    tier     = TipTier::Info;
    double                                     priority = 0.0;
    double                                     score    = 0.0;
    std::string                                message{};
};

/// Tier for a category sub-score: >=80 mild, >=60 moderate, else severe.
TipTier tier_for(double sub_score);

/// Prioritized driver tips for one score: a tip for every category scoring
/// below 85 plus the overall-grade tip, highest priority first. RPM and speed
/// figures quoted in the messages come from `config`.
std::vector<CoachingTip> coaching_tips(const scoring::HeavyFootScore& score,
                                       const config::BehaviorConfig&  config,
                                       std::size_t                    max_tips = 5);

const char* tier_to_string(TipTier tier);

} // namespace drivescore::fleet
