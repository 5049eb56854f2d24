#include "drivescore/detection/behavior_event.hpp"

#include <numeric>

namespace drivescore::detection {

double FuelWasteBreakdown::total() const
{
    return std::accumulate(gallons.begin(), gallons.end(), 0.0);
}

BehaviorCategory FuelWasteBreakdown::largest() const
{
    BehaviorCategory best = kAllBehaviorCategories.front();
    for (const auto category : kAllBehaviorCategories) {
        if ((*this)[category] > (*this)[best]) {
            best = category;
        }
    }
    return best;
}

const char* category_to_string(BehaviorCategory category)
{
    switch (category) {
        case BehaviorCategory::HardAcceleration: return "hard_acceleration";
        case BehaviorCategory::HardBraking: return "hard_braking";
        case BehaviorCategory::ExcessiveRpm: return "excessive_rpm";
        case BehaviorCategory::WrongGear: return "wrong_gear";
        case BehaviorCategory::Overspeeding: return "overspeeding";
    }
    return "unknown";
}

const char* severity_to_string(Severity severity)
{
    switch (severity) {
        case Severity::Minor: return "minor";
        case Severity::Moderate: return "moderate";
        case Severity::Severe: return "severe";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

const char* source_to_string(EventSource source)
{
    switch (source) {
        case EventSource::Computed: return "computed";
        case EventSource::Device: return "device_accelerometer";
    }
    return "unknown";
}

} // namespace drivescore::detection
