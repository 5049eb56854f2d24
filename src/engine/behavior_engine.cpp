#include "drivescore/engine/behavior_engine.hpp"

#include <sstream>
#include <utility>

#include "drivescore/common/errors.hpp"

namespace drivescore::engine {

namespace {

state::StateLayout layout_from(const config::BehaviorConfig& config)
{
    state::StateLayout layout;
    layout.max_gear           = config.wrong_gear.default_max_gear;
    layout.mpg_window         = config.cross_validation.window;
    layout.event_log_capacity = config.event_log_capacity;
    return layout;
}

const config::BehaviorConfig& validated(const config::BehaviorConfig& config)
{
    config.validate();
    return config;
}

} // namespace

BehaviorEngine::BehaviorEngine(const InitParams& init)
    : config_(validated(init.config))
    , log_sink_(init.log_sink)
    , detector_(config_)
    , cross_validator_(config_.cross_validation)
    , aggregator_(config_)
    , store_(layout_from(config_))
{
}

std::vector<detection::BehaviorEvent> BehaviorEngine::process(const telemetry::TelemetrySample& sample)
{
    sample.validate();
    check_daily_reset(sample.timestamp);

    bool created = false;
    auto vehicle = store_.get_or_create(sample.vehicle_id, &created);
    if (created) {
        log_debug("Tracking new vehicle " + sample.vehicle_id);
    }
    return detector_.process(*vehicle, sample);
}

void BehaviorEngine::check_daily_reset(time::Timestamp sample_time)
{
    const auto day = time::utc_day(sample_time);
    if (store_.roll_over(day)) {
        std::ostringstream oss;
        oss << "Daily reset for " << store_.size() << " vehicles, new scoring day "
            << time::to_iso8601(time::Timestamp(day)).substr(0, 10);
        log_info(oss.str());
    }
}

void BehaviorEngine::assign_vehicle_type(const std::string& vehicle_id, const std::string& vehicle_type)
{
    if (vehicle_id.empty()) {
        throw ::drivescore::errors::InputError(DRIVESCORE_LOC("vehicle_id must not be empty"));
    }
    const int max_gear = config_.max_gear_for(vehicle_type);

    auto vehicle          = store_.get_or_create(vehicle_id);
    vehicle->vehicle_type = vehicle_type;
    vehicle->max_gear     = max_gear;
    // A changed gearbox invalidates the running wrong-gear timer.
    vehicle->wrong_gear.deactivate();

    std::ostringstream oss;
    oss << "Vehicle " << vehicle_id << " assigned type " << vehicle_type << " (max gear " << max_gear << ")";
    log_debug(oss.str());
}

std::optional<scoring::HeavyFootScore> BehaviorEngine::score(const std::string&    vehicle_id,
                                                             double                period_hours,
                                                             std::optional<double> driving_hours) const
{
    std::optional<scoring::HeavyFootScore> result;
    store_.visit(vehicle_id, [&](const state::VehicleState& state) {
        result = scoring::HeavyFootScorer::score(state, period_hours, driving_hours);
    });
    return result;
}

std::optional<validation::MpgCrossValidation> BehaviorEngine::cross_validate(const std::string& vehicle_id) const
{
    std::optional<validation::MpgCrossValidation> result;
    store_.visit(vehicle_id, [&](const state::VehicleState& state) { result = cross_validator_.validate(state); });
    return result;
}

std::optional<fleet::FleetSummary> BehaviorEngine::fleet_summary(double period_hours) const
{
    std::vector<scoring::HeavyFootScore> scores;
    store_.for_each([&](const state::VehicleState& state) {
        scores.push_back(scoring::HeavyFootScorer::score(state, period_hours));
    });
    return aggregator_.summarize(std::move(scores));
}

std::optional<std::vector<fleet::CoachingTip>> BehaviorEngine::coaching(const std::string& vehicle_id,
                                                                        std::size_t        max_tips,
                                                                        double             period_hours) const
{
    const auto vehicle_score = score(vehicle_id, period_hours);
    if (!vehicle_score) {
        return std::nullopt;
    }
    return fleet::coaching_tips(*vehicle_score, config_, max_tips);
}

std::optional<std::vector<detection::BehaviorEvent>> BehaviorEngine::recent_events(const std::string& vehicle_id) const
{
    std::optional<std::vector<detection::BehaviorEvent>> result;
    store_.visit(vehicle_id, [&](const state::VehicleState& state) { result = state.events.snapshot(); });
    return result;
}

std::optional<state::VehicleState> BehaviorEngine::snapshot(const std::string& vehicle_id) const
{
    std::optional<state::VehicleState> result;
    store_.visit(vehicle_id, [&](const state::VehicleState& state) { result = state; });
    return result;
}

std::size_t BehaviorEngine::evict(const std::unordered_set<std::string>& active_ids,
                                  std::chrono::seconds                   max_inactive,
                                  time::Timestamp                        now)
{
    const auto removed = store_.evict(active_ids, max_inactive, now);
    for (const auto& vehicle_id : removed) {
        log_info("Evicted inactive vehicle " + vehicle_id);
    }
    return removed.size();
}

std::size_t BehaviorEngine::evict(const std::unordered_set<std::string>& active_ids, std::chrono::seconds max_inactive)
{
    return evict(active_ids, max_inactive, time::Clock::now());
}

void BehaviorEngine::log_debug(const std::string& message) const
{
    logging::log(log_sink_.get(), logging::Level::Debug, message);
}

void BehaviorEngine::log_info(const std::string& message) const
{
    logging::log(log_sink_.get(), logging::Level::Info, message);
}

} // namespace drivescore::engine
