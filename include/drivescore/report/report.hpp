#pragma once

#include <string>
#include <vector>

#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/fleet/coaching.hpp"
#include "drivescore/fleet/fleet_summary.hpp"
#include "drivescore/scoring/heavy_foot_score.hpp"
#include "drivescore/validation/mpg_cross_validator.hpp"

namespace drivescore::report {

// Compact single-line JSON renderings. Timestamps are ISO-8601 UTC strings,
// categories use their snake_case names.
std::string to_json(const detection::BehaviorEvent& event);
std::string to_json(const std::vector<detection::BehaviorEvent>& events);
std::string to_json(const scoring::HeavyFootScore& score);
std::string to_json(const validation::MpgCrossValidation& result);
std::string to_json(const fleet::FleetSummary& summary);
std::string to_json(const std::vector<fleet::CoachingTip>& tips);

/// JSON string literal for `text`, including the surrounding quotes.
std::string quote(const std::string& text);

} // namespace drivescore::report
