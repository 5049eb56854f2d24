#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "drivescore/common/time.hpp"
#include "drivescore/state/vehicle_state.hpp"

namespace drivescore::state {

/// Keyed store of per-vehicle records.
///
/// Locking: the map is guarded by a shared mutex and every record by its own
/// mutex. Per-vehicle access holds the map lock shared and the record lock
/// exclusively, so different vehicles proceed in parallel while samples for
/// one vehicle are serialized. Creation, eviction and the daily rollover take
/// the map lock exclusively. A thread must not open a second handle while it
/// still holds one.
class VehicleStateStore {
private:
    struct Entry {
        Entry(std::string id, const StateLayout& layout)
            : state(std::move(id), layout)
        {
        }

        std::mutex   mutex;
        VehicleState state;
    };

public:
    /// Exclusive access to one record for the lifetime of the handle.
    class Handle {
    public:
        VehicleState& operator*() const { return *state_; }
        VehicleState* operator->() const { return state_; }

    private:
        friend class VehicleStateStore;

        Handle(std::shared_lock<std::shared_mutex> map_lock, Entry& entry)
            : map_lock_(std::move(map_lock))
            , vehicle_lock_(entry.mutex)
            , state_(&entry.state)
        {
        }

        std::shared_lock<std::shared_mutex> map_lock_;
        std::unique_lock<std::mutex>        vehicle_lock_;
        VehicleState*                       state_;
    };

    explicit VehicleStateStore(StateLayout layout);

    /// Lazily creates the record on first access; never fails.
    Handle get_or_create(const std::string& vehicle_id, bool* created = nullptr);

    /// Runs `fn(const VehicleState&)` under the record lock. Returns false
    /// when the vehicle is not tracked.
    template <typename Fn>
    bool visit(const std::string& vehicle_id, Fn&& fn) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = entries_.find(vehicle_id);
        if (it == entries_.end()) {
            return false;
        }
        std::lock_guard<std::mutex> vehicle_lock(it->second->mutex);
        fn(static_cast<const VehicleState&>(it->second->state));
        return true;
    }

    /// Runs `fn(const VehicleState&)` for every record against one consistent
    /// view of the map.
    template <typename Fn>
    void for_each(Fn&& fn) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            std::lock_guard<std::mutex> vehicle_lock(entry->mutex);
            fn(static_cast<const VehicleState&>(entry->state));
        }
    }

    /// Removes every vehicle absent from `active_ids` or last seen before
    /// `now - max_inactive`. Records that never received a sample are only
    /// removed by the first rule. Returns the removed ids.
    std::vector<std::string> evict(const std::unordered_set<std::string>& active_ids,
                                   std::chrono::seconds                   max_inactive,
                                   time::Timestamp                        now);

    /// Records `day` as the current scoring day. When `day` is later than the
    /// previous one every record is reset and true is returned.
    bool roll_over(time::UtcDay day);

    [[nodiscard]] std::optional<time::UtcDay> last_reset_day() const;
    [[nodiscard]] std::size_t                 size() const;
    [[nodiscard]] std::vector<std::string>    vehicle_ids() const;

private:
    StateLayout                                             layout_;
    mutable std::shared_mutex                               mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
    std::optional<time::UtcDay>                             last_reset_day_{};
};

} // namespace drivescore::state
