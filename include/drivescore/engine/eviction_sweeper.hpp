#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "drivescore/common/logging.hpp"
#include "drivescore/engine/behavior_engine.hpp"

namespace drivescore::engine {

/// Background thread that periodically evicts vehicles from a BehaviorEngine.
class EvictionSweeper {
public:
    using ActiveFleetProvider = std::function<std::unordered_set<std::string>()>;

    struct Params {
        std::chrono::milliseconds period{std::chrono::hours(1)};
        std::chrono::seconds      max_inactive{std::chrono::hours(24 * 30)};
    };

    /// `engine` must outlive the sweeper.
    EvictionSweeper(BehaviorEngine& engine, ActiveFleetProvider active_fleet, Params params);
    ~EvictionSweeper();

    EvictionSweeper(const EvictionSweeper&)            = delete;
    EvictionSweeper& operator=(const EvictionSweeper&) = delete;

    void start();
    void stop();

    /// Runs one sweep on the calling thread. Returns the number evicted.
    std::size_t sweep_now();

    [[nodiscard]] bool        running() const { return running_.load(); }
    [[nodiscard]] std::size_t total_evicted() const { return total_evicted_.load(); }

private:
    BehaviorEngine&     engine_;
    ActiveFleetProvider active_fleet_;
    Params              params_;

    std::thread              worker_;
    std::atomic<bool>        running_{false};
    std::atomic<std::size_t> total_evicted_{0};
    std::mutex               mutex_;
    std::condition_variable  wake_;

    void worker_loop();
};

} // namespace drivescore::engine
