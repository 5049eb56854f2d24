#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>

#include "drivescore/common/ring_buffer.hpp"
#include "drivescore/common/time.hpp"
#include "drivescore/detection/behavior_event.hpp"

namespace drivescore::state {

/// Two-state machine for a condition whose duration matters. `start` is set
/// only while the condition has been continuously true.
struct SustainedCondition {
    std::optional<time::Timestamp> start{};
    bool                           reported          = false; // threshold event already emitted
    bool                           critical_reported = false; // RPM escalation only

    [[nodiscard]] bool   active() const { return start.has_value(); }
    [[nodiscard]] double duration_s(time::Timestamp now) const
    {
        return start ? time::seconds_between(*start, now) : 0.0;
    }

    void activate(time::Timestamp now)
    {
        if (!start) {
            start             = now;
            reported          = false;
            critical_reported = false;
        }
    }

    /// Re-times a running condition from `t` and re-arms its events. An
    /// inactive condition stays inactive.
    void restart_at(time::Timestamp t)
    {
        if (start) {
            start             = std::max(*start, t);
            reported          = false;
            critical_reported = false;
        }
    }

    void deactivate() { *this = SustainedCondition{}; }
};

/// Occurrence counters and sustained durations for the current scoring day.
struct BehaviorCounters {
    int    hard_accel_count     = 0;
    int    hard_brake_count     = 0;
    double high_rpm_seconds     = 0.0;
    double wrong_gear_seconds   = 0.0;
    double overspeeding_seconds = 0.0;
};

struct StateLayout {
    int         max_gear           = 13;
    std::size_t mpg_window         = 10;
    std::size_t event_log_capacity = 512;
};

struct VehicleState {
    VehicleState(std::string id, const StateLayout& layout);

    std::string                vehicle_id;
    std::optional<std::string> vehicle_type{};
    int                        max_gear;

    std::optional<double>          last_speed{};
    std::optional<double>          last_rpm{};
    std::optional<int>             last_gear{};
    std::optional<time::Timestamp> last_time{};

    SustainedCondition high_rpm{};
    SustainedCondition wrong_gear{};
    SustainedCondition overspeeding{};

    BehaviorCounters              counters{};
    detection::FuelWasteBreakdown fuel_waste{};

    common::RingBuffer<detection::BehaviorEvent> events;
    common::RingBuffer<double>                   kalman_mpg;
    common::RingBuffer<double>                   ecu_mpg;

    /// Zero counters, durations, fuel waste and the event log. Conditions still
    /// active are re-timed from `day_start` so they report again on the new
    /// day. Last-seen values and the MPG windows survive.
    void reset_daily(time::Timestamp day_start);
};

} // namespace drivescore::state
