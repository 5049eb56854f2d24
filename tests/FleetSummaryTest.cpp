#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/fleet/coaching.hpp"
#include "drivescore/fleet/fleet_summary.hpp"

using drivescore::config::BehaviorConfig;
using drivescore::detection::BehaviorCategory;
using drivescore::fleet::coaching_tips;
using drivescore::fleet::FleetAggregator;
using drivescore::fleet::tier_for;
using drivescore::fleet::TipTier;
using drivescore::scoring::HeavyFootScore;

namespace {

HeavyFootScore make_score(const std::string& id, double overall)
{
    HeavyFootScore score{};
    score.vehicle_id = id;
    score.overall    = overall;
    score.grade      = drivescore::scoring::grade_for(overall);
    return score;
}

std::size_t index_of(BehaviorCategory category)
{
    return static_cast<std::size_t>(category);
}

} // namespace

TEST(FleetSummaryTest, EmptyFleetHasNoSummary)
{
    FleetAggregator aggregator{BehaviorConfig{}};
    EXPECT_FALSE(aggregator.summarize({}).has_value());
}

TEST(FleetSummaryTest, RanksVehiclesAndRecommends)
{
    auto good = make_score("T1", 95.0);
    auto bad  = make_score("T2", 40.0);
    auto mid  = make_score("T3", 65.0);
    good.fuel_waste[BehaviorCategory::HardAcceleration] = 0.10;
    bad.fuel_waste[BehaviorCategory::ExcessiveRpm]      = 0.50;
    mid.fuel_waste[BehaviorCategory::ExcessiveRpm]      = 0.20;

    FleetAggregator aggregator{BehaviorConfig{}};
    const auto      summary = aggregator.summarize({good, bad, mid});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary->fleet_size, 3u);
    EXPECT_NEAR(summary->average_score, 200.0 / 3.0, 1e-9);
    EXPECT_EQ(summary->needs_work_count, 2u);

    ASSERT_EQ(summary->best.size(), 3u);
    EXPECT_EQ(summary->best[0].vehicle_id, "T1");
    EXPECT_EQ(summary->best[2].vehicle_id, "T2");
    ASSERT_EQ(summary->worst.size(), 3u);
    EXPECT_EQ(summary->worst[0].vehicle_id, "T2");
    EXPECT_EQ(summary->worst[1].vehicle_id, "T3");

    EXPECT_EQ(summary->biggest_issue, BehaviorCategory::ExcessiveRpm);
    EXPECT_NEAR(summary->biggest_issue_gal, 0.70, 1e-12);
    EXPECT_NEAR(summary->total_fuel_waste_gal, 0.80, 1e-12);

    const std::vector<std::string> expected{
        "Fleet average score is below 70 - consider driver training program",
        "High RPM operation is wasting fuel - train drivers on optimal RPM range (1200-1600)",
        "1 vehicles need immediate attention: T2",
    };
    EXPECT_EQ(summary->recommendations, expected);
}

TEST(FleetSummaryTest, HealthyFleetWithoutWasteHasNoRecommendations)
{
    FleetAggregator aggregator{BehaviorConfig{}};
    const auto      summary = aggregator.summarize({make_score("A", 92.0), make_score("B", 88.0)});
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary->recommendations.empty());
    EXPECT_EQ(summary->needs_work_count, 0u);
    EXPECT_EQ(summary->best.size(), 2u);
}

TEST(FleetSummaryTest, ListsAtMostFiveUrgentVehicles)
{
    std::vector<HeavyFootScore> scores;
    for (int i = 6; i >= 0; --i) {
        scores.push_back(make_score("V" + std::to_string(i), 10.0 + i));
    }

    FleetAggregator aggregator{BehaviorConfig{}};
    const auto      summary = aggregator.summarize(scores);
    ASSERT_TRUE(summary.has_value());
    ASSERT_FALSE(summary->recommendations.empty());
    EXPECT_EQ(summary->recommendations.back(), "7 vehicles need immediate attention: V0, V1, V2, V3, V4");
}

TEST(FleetSummaryTest, OverspeedRecommendationUsesFuelBaseline)
{
    auto speeder = make_score("S1", 85.0);
    speeder.fuel_waste[BehaviorCategory::Overspeeding] = 0.4;

    FleetAggregator aggregator{BehaviorConfig{}};
    const auto      summary = aggregator.summarize({speeder});
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(summary->recommendations.size(), 1u);
    EXPECT_EQ(summary->recommendations[0],
              "Overspeeding is wasting fuel - each mph above 65 reduces efficiency by ~0.1 MPG");
}

TEST(FleetSummaryTest, BehaviorScoresAverageAcrossVehicles)
{
    auto a             = make_score("A", 80.0);
    a.hard_accel_count = 2;
    a.high_rpm_minutes = 10.0;
    auto b                 = make_score("B", 80.0);
    b.hard_accel_count     = 4;
    b.high_rpm_minutes     = 30.0;
    b.overspeeding_minutes = 300.0;

    FleetAggregator aggregator{BehaviorConfig{}};
    const auto      summary = aggregator.summarize({a, b});
    ASSERT_TRUE(summary.has_value());

    const auto& behavior = summary->behavior_scores;
    EXPECT_DOUBLE_EQ(behavior[index_of(BehaviorCategory::HardAcceleration)], 76.0);
    EXPECT_DOUBLE_EQ(behavior[index_of(BehaviorCategory::HardBraking)], 100.0);
    EXPECT_DOUBLE_EQ(behavior[index_of(BehaviorCategory::ExcessiveRpm)], 60.0);
    EXPECT_DOUBLE_EQ(behavior[index_of(BehaviorCategory::WrongGear)], 70.0);
    EXPECT_DOUBLE_EQ(behavior[index_of(BehaviorCategory::Overspeeding)], 0.0);
}

TEST(CoachingTest, TierBoundaries)
{
    EXPECT_EQ(tier_for(84.0), TipTier::Mild);
    EXPECT_EQ(tier_for(80.0), TipTier::Mild);
    EXPECT_EQ(tier_for(79.9), TipTier::Moderate);
    EXPECT_EQ(tier_for(60.0), TipTier::Moderate);
    EXPECT_EQ(tier_for(59.9), TipTier::Severe);
}

TEST(CoachingTest, TipsAreOrderedByPriority)
{
    auto score                    = make_score("T1", 75.0);
    score.sub_scores.acceleration = 91.0;
    score.sub_scores.braking      = 50.0;
    score.sub_scores.rpm          = 70.0;
    score.sub_scores.speed        = 84.0;

    const auto tips = coaching_tips(score, BehaviorConfig{});
    ASSERT_EQ(tips.size(), 4u);
    EXPECT_EQ(tips[0].category, BehaviorCategory::HardBraking);
    EXPECT_EQ(tips[0].tier, TipTier::Severe);
    EXPECT_DOUBLE_EQ(tips[0].priority, 50.0);
    EXPECT_EQ(tips[1].category, BehaviorCategory::ExcessiveRpm);
    EXPECT_EQ(tips[1].tier, TipTier::Moderate);
    EXPECT_EQ(tips[2].category, BehaviorCategory::Overspeeding);
    EXPECT_EQ(tips[2].tier, TipTier::Mild);
    EXPECT_FALSE(tips[3].category.has_value());
    EXPECT_EQ(tips[3].message, "Grade C - Room for improvement. Focus on your biggest issue first.");
}

TEST(CoachingTest, TruncatesToMaxTips)
{
    auto score                    = make_score("T1", 40.0);
    score.sub_scores.acceleration = 10.0;
    score.sub_scores.braking      = 20.0;
    score.sub_scores.rpm          = 30.0;

    const auto tips = coaching_tips(score, BehaviorConfig{}, 2);
    ASSERT_EQ(tips.size(), 2u);
    EXPECT_EQ(tips[0].category, BehaviorCategory::HardAcceleration);
    EXPECT_EQ(tips[1].category, BehaviorCategory::HardBraking);
}

TEST(CoachingTest, PerfectScoreOnlyGetsGradeTip)
{
    const auto tips = coaching_tips(make_score("T1", 100.0), BehaviorConfig{});
    ASSERT_EQ(tips.size(), 1u);
    EXPECT_EQ(tips[0].message, "Grade A - Excellent driver! Share your techniques with the team.");
    EXPECT_EQ(tips[0].tier, TipTier::Info);
}

TEST(CoachingTest, MessagesQuoteConfiguredBands)
{
    BehaviorConfig config{};
    config.rpm.optimal_min         = 1100;
    config.rpm.optimal_max         = 1450;
    config.speed.excessive         = 68.0;
    config.speed.fuel_baseline_mph = 62.0;

    auto score                  = make_score("T1", 60.0);
    score.sub_scores.rpm       = 82.0;
    score.sub_scores.speed     = 40.0;
    score.overspeeding_minutes = 45.0;

    const auto tips = coaching_tips(score, config);
    ASSERT_EQ(tips.size(), 3u);
    EXPECT_EQ(tips[0].category, BehaviorCategory::Overspeeding);
    EXPECT_EQ(tips[0].message, "Speed consistently above 68 mph. Fuel economy drops ~15% compared to 62 mph.");
    EXPECT_EQ(tips[1].category, BehaviorCategory::ExcessiveRpm);
    EXPECT_EQ(tips[1].message, "Sweet spot is 1100-1450 RPM. Your engine's peak torque = best efficiency.");

    score.sub_scores.speed = 81.0;
    const auto mild        = coaching_tips(score, config);
    ASSERT_EQ(mild[0].category, BehaviorCategory::Overspeeding);
    EXPECT_EQ(mild[0].message, "62 mph = optimal. Each mph above reduces efficiency by ~0.1 MPG.");
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
