#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "drivescore/common/time.hpp"
#include "drivescore/config/behavior_config.hpp"
#include "drivescore/fleet/coaching.hpp"
#include "drivescore/fleet/fleet_summary.hpp"
#include "drivescore/report/report.hpp"
#include "tests/TestSamples.hpp"

using drivescore::detection::BehaviorCategory;
using drivescore::detection::BehaviorEvent;
using drivescore::detection::EventSource;
using drivescore::detection::Severity;
using drivescore::report::quote;
using drivescore::report::to_json;

namespace {

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ReportTest, FormatsTimestampsAsUtc)
{
    EXPECT_EQ(drivescore::time::to_iso8601(drivescore::test::at(3.5)), "2025-12-01T08:00:03.500Z");
}

TEST(ReportTest, QuotesAndEscapesStrings)
{
    EXPECT_EQ(quote("plain"), "\"plain\"");
    EXPECT_EQ(quote("say \"hi\"\n"), "\"say \\\"hi\\\"\\n\"");
    EXPECT_EQ(quote(std::string("a\x01") + "b"), "\"a\\u0001b\"");
}

TEST(ReportTest, EventJsonCarriesContext)
{
    BehaviorEvent event{};
    event.vehicle_id           = "T1";
    event.timestamp            = drivescore::test::at(0.0);
    event.category             = BehaviorCategory::HardBraking;
    event.severity             = Severity::Moderate;
    event.value                = 320.0;
    event.threshold            = 320.0;
    event.fuel_waste_gal       = 0.04;
    event.context.source       = EventSource::Device;
    event.context.device_count = 2;
    event.context.unit         = "mg";

    const auto json = to_json(event);
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_TRUE(contains(json, "\"timestamp\":\"2025-12-01T08:00:00.000Z\""));
    EXPECT_TRUE(contains(json, "\"category\":\"hard_braking\""));
    EXPECT_TRUE(contains(json, "\"severity\":\"moderate\""));
    EXPECT_TRUE(contains(json, "\"fuel_waste_gal\":0.0400"));
    EXPECT_TRUE(contains(json, "\"source\":\"device_accelerometer\""));
    EXPECT_TRUE(contains(json, "\"device_count\":2"));
    EXPECT_TRUE(contains(json, "\"gear\":null"));

    EXPECT_EQ(to_json(std::vector<BehaviorEvent>{}), "[]");
    EXPECT_EQ(to_json(std::vector<BehaviorEvent>{event, event}), "[" + json + "," + json + "]");
}

TEST(ReportTest, ScoreJsonCarriesComponentsAndWaste)
{
    drivescore::scoring::HeavyFootScore score{};
    score.vehicle_id                              = "T1";
    score.overall                                 = 85.5;
    score.grade                                   = 'B';
    score.sub_scores.rpm                          = 70.0;
    score.fuel_waste[BehaviorCategory::WrongGear] = 0.25;
    score.total_fuel_waste_gal                    = 0.25;

    const auto json = to_json(score);
    EXPECT_TRUE(contains(json, "\"score\":85.5000"));
    EXPECT_TRUE(contains(json, "\"grade\":\"B\""));
    EXPECT_TRUE(contains(json, "\"rpm\":70.0000"));
    EXPECT_TRUE(contains(json, "\"wrong_gear\":0.2500"));
    EXPECT_TRUE(contains(json, "\"total_gal\":0.2500"));
}

TEST(ReportTest, CrossValidationJson)
{
    drivescore::validation::MpgCrossValidation result{};
    result.vehicle_id     = "T1";
    result.difference_pct = 16.6667;
    result.is_valid       = false;
    result.recommendation = "Kalman MPG 16.7% higher than ECU - may be overestimating";

    const auto json = to_json(result);
    EXPECT_TRUE(contains(json, "\"is_valid\":false"));
    EXPECT_TRUE(contains(json, "\"recommendation\":\"Kalman MPG 16.7% higher than ECU - may be overestimating\""));
}

TEST(ReportTest, FleetAndCoachingJson)
{
    drivescore::scoring::HeavyFootScore score{};
    score.vehicle_id                                 = "T1";
    score.overall                                    = 45.0;
    score.grade                                      = 'F';
    score.fuel_waste[BehaviorCategory::ExcessiveRpm] = 0.3;

    drivescore::fleet::FleetAggregator aggregator{drivescore::config::BehaviorConfig{}};
    const auto                         summary = aggregator.summarize({score});
    ASSERT_TRUE(summary.has_value());

    const auto fleet_json = to_json(*summary);
    EXPECT_TRUE(contains(fleet_json, "\"fleet_size\":1"));
    EXPECT_TRUE(contains(fleet_json, "\"biggest_issue\":{\"category\":\"excessive_rpm\",\"gallons\":0.3000}"));
    EXPECT_TRUE(contains(fleet_json, "\"worst_performers\":[{\"vehicle_id\":\"T1\""));
    EXPECT_TRUE(contains(fleet_json, "1 vehicles need immediate attention: T1"));

    const auto tips_json = to_json(drivescore::fleet::coaching_tips(score, drivescore::config::BehaviorConfig{}));
    EXPECT_TRUE(contains(tips_json, "\"category\":\"overall_grade\""));
    EXPECT_TRUE(contains(tips_json, "\"tier\":\"info\""));
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
