#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "drivescore/common/logging.hpp"
#include "drivescore/common/time.hpp"
#include "drivescore/config/behavior_config.hpp"
#include "drivescore/detection/behavior_detector.hpp"
#include "drivescore/detection/behavior_event.hpp"
#include "drivescore/fleet/coaching.hpp"
#include "drivescore/fleet/fleet_summary.hpp"
#include "drivescore/scoring/heavy_foot_score.hpp"
#include "drivescore/state/vehicle_state.hpp"
#include "drivescore/state/vehicle_state_store.hpp"
#include "drivescore/telemetry/sample.hpp"
#include "drivescore/validation/mpg_cross_validator.hpp"

namespace drivescore::engine {

inline constexpr double kDefaultPeriodHours = 24.0;

/// Entry point for telemetry ingestion and the pull-based reports.
///
/// Thread-safe: samples for different vehicles may be processed concurrently,
/// samples for the same vehicle are serialized.
class BehaviorEngine {
public:
    struct InitParams {
        config::BehaviorConfig config{};
        logging::LogSinkPtr    log_sink{};

        void use_default_log_sink()
        {
            if (!log_sink) {
                log_sink = logging::make_console_log_sink();
            }
        }
    };

    explicit BehaviorEngine(const InitParams& init);

    /// Validates the sample, applies the daily reset and runs the detectors.
    /// Throws errors::InputError for a malformed sample.
    std::vector<detection::BehaviorEvent> process(const telemetry::TelemetrySample& sample);

    /// Binds `vehicle_id` to a configured transmission type, creating the
    /// record if needed. Throws errors::ConfigError for an unknown type.
    void assign_vehicle_type(const std::string& vehicle_id, const std::string& vehicle_type);

    [[nodiscard]] std::optional<scoring::HeavyFootScore> score(const std::string&    vehicle_id,
                                                               double                period_hours  = kDefaultPeriodHours,
                                                               std::optional<double> driving_hours = std::nullopt) const;

    [[nodiscard]] std::optional<validation::MpgCrossValidation> cross_validate(const std::string& vehicle_id) const;

    /// Scores every tracked vehicle over `period_hours` and aggregates them.
    [[nodiscard]] std::optional<fleet::FleetSummary> fleet_summary(double period_hours = kDefaultPeriodHours) const;

    [[nodiscard]] std::optional<std::vector<fleet::CoachingTip>> coaching(
        const std::string& vehicle_id,
        std::size_t        max_tips     = 5,
        double             period_hours = kDefaultPeriodHours) const;

    /// Current-day event log, oldest first.
    [[nodiscard]] std::optional<std::vector<detection::BehaviorEvent>> recent_events(
        const std::string& vehicle_id) const;

    [[nodiscard]] std::optional<state::VehicleState> snapshot(const std::string& vehicle_id) const;

    /// Drops vehicles that left the fleet or were silent for `max_inactive`.
    /// Returns the number removed.
    std::size_t evict(const std::unordered_set<std::string>& active_ids,
                      std::chrono::seconds                   max_inactive,
                      time::Timestamp                        now);
    std::size_t evict(const std::unordered_set<std::string>& active_ids, std::chrono::seconds max_inactive);

    [[nodiscard]] std::size_t                   vehicle_count() const { return store_.size(); }
    [[nodiscard]] std::vector<std::string>      vehicle_ids() const { return store_.vehicle_ids(); }
    [[nodiscard]] const config::BehaviorConfig& config() const noexcept { return config_; }
    [[nodiscard]] const logging::LogSinkPtr&    log_sink() const noexcept { return log_sink_; }

private:
    config::BehaviorConfig        config_;
    logging::LogSinkPtr           log_sink_;
    detection::BehaviorDetector   detector_;
    validation::MpgCrossValidator cross_validator_;
    fleet::FleetAggregator        aggregator_;
    state::VehicleStateStore      store_;

    void log_debug(const std::string& message) const;
    void log_info(const std::string& message) const;
    void check_daily_reset(time::Timestamp sample_time);
};

} // namespace drivescore::engine
