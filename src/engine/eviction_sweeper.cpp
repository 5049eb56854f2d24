#include "drivescore/engine/eviction_sweeper.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "drivescore/common/errors.hpp"

namespace drivescore::engine {

EvictionSweeper::EvictionSweeper(BehaviorEngine& engine, ActiveFleetProvider active_fleet, Params params)
    : engine_(engine)
    , active_fleet_(std::move(active_fleet))
    , params_(params)
{
    if (!active_fleet_) {
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC("EvictionSweeper requires an active fleet provider"));
    }
    if (params_.period.count() <= 0) {
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC("EvictionSweeper period must be positive"));
    }
}

EvictionSweeper::~EvictionSweeper() { stop(); }

void EvictionSweeper::start()
{
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&EvictionSweeper::worker_loop, this);
}

void EvictionSweeper::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::size_t EvictionSweeper::sweep_now()
{
    const std::size_t removed = engine_.evict(active_fleet_(), params_.max_inactive);
    total_evicted_ += removed;
    return removed;
}

void EvictionSweeper::worker_loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (wake_.wait_for(lock, params_.period, [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        try {
            sweep_now();
        } catch (const std::exception& ex) {
            // The provider or the engine failed this round; retry next period.
            std::ostringstream oss;
            oss << "Eviction sweep failed: " << ex.what();
            logging::log(engine_.log_sink().get(), logging::Level::Error, oss.str());
        }
        lock.lock();
    }
}

} // namespace drivescore::engine
