#include "drivescore/state/vehicle_state.hpp"

#include <initializer_list>
#include <utility>

namespace drivescore::state {

VehicleState::VehicleState(std::string id, const StateLayout& layout)
    : vehicle_id(std::move(id))
    , max_gear(layout.max_gear)
    , events(layout.event_log_capacity)
    , kalman_mpg(layout.mpg_window)
    , ecu_mpg(layout.mpg_window)
{
}

void VehicleState::reset_daily(time::Timestamp day_start)
{
    for (SustainedCondition* condition : {&high_rpm, &wrong_gear, &overspeeding}) {
        condition->restart_at(day_start);
    }
    counters   = BehaviorCounters{};
    fuel_waste = detection::FuelWasteBreakdown{};
    events.clear();
}

} // namespace drivescore::state
