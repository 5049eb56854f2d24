#include "gtest/gtest.h"

#include <cmath>
#include <limits>

#include "drivescore/common/errors.hpp"
#include "drivescore/scoring/heavy_foot_score.hpp"
#include "tests/TestSamples.hpp"

using drivescore::detection::BehaviorCategory;
using drivescore::scoring::grade_for;
using drivescore::scoring::HeavyFootScorer;
using drivescore::scoring::SubScores;
using drivescore::state::StateLayout;
using drivescore::state::VehicleState;

namespace {

VehicleState busy_truck()
{
    VehicleState truck{"T7", StateLayout{}};
    truck.counters.hard_accel_count     = 5;
    truck.counters.hard_brake_count     = 3;
    truck.counters.high_rpm_seconds     = 720.0; // 12 min
    truck.counters.overspeeding_seconds = 360.0; // 6 min
    truck.fuel_waste[BehaviorCategory::HardAcceleration] = 0.30;
    truck.fuel_waste[BehaviorCategory::ExcessiveRpm]     = 0.24;
    truck.fuel_waste[BehaviorCategory::Overspeeding]     = 0.06;
    truck.last_time = drivescore::test::at(3600.0);
    return truck;
}

} // namespace

TEST(HeavyFootScoreTest, WeightsSubScoresIntoOverall)
{
    const auto score = HeavyFootScorer::score(busy_truck(), 1.0, 1.0);

    EXPECT_DOUBLE_EQ(score.sub_scores.acceleration, 91.0);
    EXPECT_DOUBLE_EQ(score.sub_scores.braking, 100.0);
    EXPECT_NEAR(score.sub_scores.rpm, 70.0, 1e-9);
    EXPECT_DOUBLE_EQ(score.sub_scores.gear, 100.0);
    EXPECT_NEAR(score.sub_scores.speed, 85.0, 1e-9);
    EXPECT_NEAR(score.overall, 89.05, 1e-9);
    EXPECT_EQ(score.grade, 'B');

    EXPECT_EQ(score.hard_accel_count, 5);
    EXPECT_DOUBLE_EQ(score.high_rpm_minutes, 12.0);
    EXPECT_DOUBLE_EQ(score.overspeeding_minutes, 6.0);
    EXPECT_NEAR(score.total_fuel_waste_gal, 0.60, 1e-12);
    EXPECT_EQ(score.timestamp, drivescore::test::at(3600.0));
}

TEST(HeavyFootScoreTest, OverallMatchesWeightedSum)
{
    SubScores sub{};
    sub.acceleration = 50.0;
    sub.braking      = 60.0;
    sub.rpm          = 70.0;
    sub.gear         = 80.0;
    sub.speed        = 90.0;
    EXPECT_NEAR(HeavyFootScorer::overall(sub), 0.30 * 50 + 0.20 * 60 + 0.20 * 70 + 0.15 * 80 + 0.15 * 90, 1e-12);
}

TEST(HeavyFootScoreTest, GradeBoundaries)
{
    EXPECT_EQ(grade_for(100.0), 'A');
    EXPECT_EQ(grade_for(90.0), 'A');
    EXPECT_EQ(grade_for(89.999), 'B');
    EXPECT_EQ(grade_for(80.0), 'B');
    EXPECT_EQ(grade_for(79.999), 'C');
    EXPECT_EQ(grade_for(70.0), 'C');
    EXPECT_EQ(grade_for(69.999), 'D');
    EXPECT_EQ(grade_for(60.0), 'D');
    EXPECT_EQ(grade_for(59.999), 'F');
    EXPECT_EQ(grade_for(0.0), 'F');
}

TEST(HeavyFootScoreTest, DefaultDrivingHoursIsFortyPercentOfPeriod)
{
    VehicleState truck{"T1", StateLayout{}};
    EXPECT_DOUBLE_EQ(HeavyFootScorer::score(truck, 24.0).driving_hours, 9.6);
    EXPECT_DOUBLE_EQ(HeavyFootScorer::score(truck, 1.0).driving_hours, 1.0);
    EXPECT_DOUBLE_EQ(HeavyFootScorer::score(truck, 24.0, 3.0).driving_hours, 3.0);
}

TEST(HeavyFootScoreTest, CleanVehicleScoresPerfect)
{
    VehicleState truck{"T1", StateLayout{}};
    const auto   score = HeavyFootScorer::score(truck, 24.0);
    EXPECT_DOUBLE_EQ(score.overall, 100.0);
    EXPECT_EQ(score.grade, 'A');
    EXPECT_DOUBLE_EQ(score.total_fuel_waste_gal, 0.0);
}

TEST(HeavyFootScoreTest, GearScoreOnlyPenalizesRecordedWrongGearTime)
{
    VehicleState truck{"T1", StateLayout{}};
    truck.counters.wrong_gear_seconds = 60.0; // under the 5% allowance
    EXPECT_DOUBLE_EQ(HeavyFootScorer::score(truck, 1.0, 1.0).sub_scores.gear, 100.0);

    truck.counters.wrong_gear_seconds = 600.0; // 10 of 60 minutes
    EXPECT_NEAR(HeavyFootScorer::score(truck, 1.0, 1.0).sub_scores.gear, 100.0 - (100.0 / 6.0 - 5.0) * 4.0, 1e-9);
}

TEST(HeavyFootScoreTest, ZeroDrivingHoursStaysFinite)
{
    VehicleState truck{"T1", StateLayout{}};
    truck.counters.high_rpm_seconds = 60.0;
    truck.counters.hard_accel_count = 1;

    const auto score = HeavyFootScorer::score(truck, 1.0, 0.0);
    EXPECT_TRUE(std::isfinite(score.overall));
    EXPECT_DOUBLE_EQ(score.sub_scores.rpm, 0.0);
    EXPECT_DOUBLE_EQ(score.sub_scores.acceleration, 97.0);
}

TEST(HeavyFootScoreTest, RejectsNonFiniteDurations)
{
    VehicleState truck{"T1", StateLayout{}};
    EXPECT_THROW((void)HeavyFootScorer::score(truck, std::numeric_limits<double>::quiet_NaN()),
                 drivescore::errors::InputError);
    EXPECT_THROW((void)HeavyFootScorer::score(truck, 24.0, std::numeric_limits<double>::infinity()),
                 drivescore::errors::InputError);
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
