#include "drivescore/state/vehicle_state_store.hpp"

#include <algorithm>

namespace drivescore::state {

VehicleStateStore::VehicleStateStore(StateLayout layout)
    : layout_(layout)
{
}

VehicleStateStore::Handle VehicleStateStore::get_or_create(const std::string& vehicle_id, bool* created)
{
    if (created) {
        *created = false;
    }

    // An eviction may run between creating the record and re-acquiring the
    // shared lock, so retry until the lookup succeeds.
    for (;;) {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            const auto                          it = entries_.find(vehicle_id);
            if (it != entries_.end()) {
                Entry& entry = *it->second;
                return Handle(std::move(lock), entry);
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (entries_.find(vehicle_id) == entries_.end()) {
            entries_.emplace(vehicle_id, std::make_unique<Entry>(vehicle_id, layout_));
            if (created) {
                *created = true;
            }
        }
    }
}

std::vector<std::string> VehicleStateStore::evict(const std::unordered_set<std::string>& active_ids,
                                                  std::chrono::seconds                   max_inactive,
                                                  time::Timestamp                        now)
{
    const time::Timestamp cutoff = now - max_inactive;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string>            removed;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const VehicleState& state = it->second->state;
        const bool inactive_fleet = active_ids.find(it->first) == active_ids.end();
        const bool stale          = state.last_time && *state.last_time < cutoff;
        if (inactive_fleet || stale) {
            removed.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(removed.begin(), removed.end());
    return removed;
}

bool VehicleStateStore::roll_over(time::UtcDay day)
{
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (last_reset_day_ && day <= *last_reset_day_) {
            return false;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!last_reset_day_) {
        last_reset_day_ = day;
        return false;
    }
    if (day <= *last_reset_day_) {
        return false;
    }
    for (auto& [id, entry] : entries_) {
        entry->state.reset_daily(time::Timestamp(day));
    }
    last_reset_day_ = day;
    return true;
}

std::optional<time::UtcDay> VehicleStateStore::last_reset_day() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_reset_day_;
}

std::size_t VehicleStateStore::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::vector<std::string> VehicleStateStore::vehicle_ids() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string>            ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace drivescore::state
