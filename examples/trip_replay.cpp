#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "drivescore/common/errors.hpp"
#include "drivescore/engine/behavior_engine.hpp"
#include "drivescore/io/config_manager.hpp"
#include "drivescore/report/report.hpp"
#include "drivescore/telemetry/sample.hpp"

namespace {

drivescore::telemetry::TelemetrySample reading(const std::string&          vehicle_id,
                                               drivescore::time::Timestamp t,
                                               double                      speed,
                                               double                      rpm,
                                               int                         gear)
{
    drivescore::telemetry::TelemetrySample sample{};
    sample.vehicle_id = vehicle_id;
    sample.timestamp  = t;
    sample.speed_mph  = speed;
    sample.rpm        = rpm;
    sample.gear       = gear;
    return sample;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace drivescore;
    using std::chrono::seconds;

    try {
        const std::filesystem::path config_root = argc > 1 ? argv[1] : DRIVESCORE_CONFIG_ROOT;
        io::ConfigManager           configs(config_root);

        engine::BehaviorEngine::InitParams init{};
        init.config = configs.load_behavior_config();
        init.use_default_log_sink();

        engine::BehaviorEngine engine(init);

        const std::string truck = "TEST001";
        const auto        start = std::chrono::floor<seconds>(time::Clock::now());
        engine.assign_vehicle_type(truck, "eaton_13_speed");

        // Steady cruise
        for (int i = 0; i < 10; ++i) {
            engine.process(reading(truck, start + seconds(i * 15), 55.0 + i * 0.5, 1400.0, 10));
        }

        // 40 -> 60 mph in 3 s
        engine.process(reading(truck, start + seconds(160), 40.0, 1400.0, 8));
        const auto launch = engine.process(reading(truck, start + seconds(163), 60.0, 2200.0, 8));
        std::cout << "launch events: " << report::to_json(launch) << std::endl;

        // Lugging in 6th with room to upshift
        for (int i = 0; i < 5; ++i) {
            const auto events = engine.process(reading(truck, start + seconds(180 + i * 10), 50.0, 1900.0, 6));
            for (const auto& event : events) {
                std::cout << "event: " << report::to_json(event) << std::endl;
            }
        }

        if (const auto score = engine.score(truck, 1.0, 0.5)) {
            std::cout << "score: " << report::to_json(*score) << std::endl;
        }
        if (const auto tips = engine.coaching(truck, 5, 1.0)) {
            std::cout << "coaching: " << report::to_json(*tips) << std::endl;
        }
        if (const auto summary = engine.fleet_summary(1.0)) {
            std::cout << "fleet: " << report::to_json(*summary) << std::endl;
        }
        if (const auto check = engine.cross_validate(truck)) {
            std::cout << "mpg: " << report::to_json(*check) << std::endl;
        } else {
            std::cout << "mpg: not enough estimates to cross-validate" << std::endl;
        }
    } catch (const errors::DriveScoreError& ex) {
        std::cerr << "trip_replay: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
