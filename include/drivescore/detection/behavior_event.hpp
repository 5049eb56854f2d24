#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include "drivescore/common/time.hpp"

namespace drivescore::detection {

enum class BehaviorCategory
{
    HardAcceleration,
    HardBraking,
    ExcessiveRpm,
    WrongGear,
    Overspeeding
};

inline constexpr std::size_t kBehaviorCategoryCount = 5;

inline constexpr std::array<BehaviorCategory, kBehaviorCategoryCount> kAllBehaviorCategories{
    BehaviorCategory::HardAcceleration,
    BehaviorCategory::HardBraking,
    BehaviorCategory::ExcessiveRpm,
    BehaviorCategory::WrongGear,
    BehaviorCategory::Overspeeding,
};

enum class Severity
{
    Minor,
    Moderate,
    Severe,
    Critical
};

enum class EventSource
{
    Computed, // derived from speed / rpm / gear signals
    Device    // reported by the accelerometer firmware
};

struct EventContext {
    EventSource           source = EventSource::Computed;
    std::optional<int>    device_count{};
    std::optional<int>    gear{};
    std::optional<double> speed_mph{};
    std::optional<double> mph_over{};
    std::string           unit{};
    std::string           message{};
};

struct BehaviorEvent {
    std::string      vehicle_id{};
    time::Timestamp  timestamp{};
    BehaviorCategory category       = BehaviorCategory::HardAcceleration;
    Severity         severity       = Severity::Minor;
    double           value          = 0.0;
    double           threshold      = 0.0;
    double           duration_s     = 0.0; // 0 for instantaneous events
    double           fuel_waste_gal = 0.0;
    EventContext     context{};
};

/// Per-category gallons, indexed by BehaviorCategory.
struct FuelWasteBreakdown {
    std::array<double, kBehaviorCategoryCount> gallons{};

    double& operator[](BehaviorCategory category) { return gallons[static_cast<std::size_t>(category)]; }
    double  operator[](BehaviorCategory category) const { return gallons[static_cast<std::size_t>(category)]; }

    [[nodiscard]] double total() const;
    /// Category with the largest total; ties resolve to the earlier category.
    [[nodiscard]] BehaviorCategory largest() const;
};

const char* category_to_string(BehaviorCategory category);
const char* severity_to_string(Severity severity);
const char* source_to_string(EventSource source);

} // namespace drivescore::detection
