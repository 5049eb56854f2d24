#include "gtest/gtest.h"

#include "drivescore/config/behavior_config.hpp"
#include "drivescore/validation/mpg_cross_validator.hpp"
#include "tests/TestSamples.hpp"

using drivescore::config::CrossValidationConfig;
using drivescore::state::StateLayout;
using drivescore::state::VehicleState;
using drivescore::validation::MpgCrossValidator;

namespace {

VehicleState with_estimates(int count, double kalman, double ecu)
{
    VehicleState truck{"T3", StateLayout{}};
    for (int i = 0; i < count; ++i) {
        truck.kalman_mpg.push(kalman);
        truck.ecu_mpg.push(ecu);
    }
    truck.last_time = drivescore::test::at(600.0);
    return truck;
}

} // namespace

TEST(MpgCrossValidatorTest, NeedsFiveSamplesInBothWindows)
{
    MpgCrossValidator validator{CrossValidationConfig{}};
    EXPECT_FALSE(validator.validate(with_estimates(4, 6.0, 6.0)).has_value());

    auto truck = with_estimates(4, 6.0, 6.0);
    truck.kalman_mpg.push(6.0);
    EXPECT_FALSE(validator.validate(truck).has_value());

    truck.ecu_mpg.push(6.0);
    EXPECT_TRUE(validator.validate(truck).has_value());
}

TEST(MpgCrossValidatorTest, FlagsOverestimatingKalman)
{
    MpgCrossValidator validator{CrossValidationConfig{}};
    const auto        result = validator.validate(with_estimates(5, 7.0, 6.0));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->vehicle_id, "T3");
    EXPECT_DOUBLE_EQ(result->kalman_mpg_avg, 7.0);
    EXPECT_DOUBLE_EQ(result->ecu_mpg_avg, 6.0);
    EXPECT_NEAR(result->difference_pct, 16.6667, 1e-3);
    EXPECT_FALSE(result->is_valid);
    EXPECT_EQ(result->recommendation, "Kalman MPG 16.7% higher than ECU - may be overestimating");
    EXPECT_EQ(result->timestamp, drivescore::test::at(600.0));
}

TEST(MpgCrossValidatorTest, FlagsUnderestimatingKalman)
{
    MpgCrossValidator validator{CrossValidationConfig{}};
    const auto        result = validator.validate(with_estimates(6, 5.0, 6.0));

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->is_valid);
    EXPECT_EQ(result->recommendation, "Kalman MPG 16.7% lower than ECU - may be underestimating");
}

TEST(MpgCrossValidatorTest, AcceptsWithinTolerance)
{
    MpgCrossValidator validator{CrossValidationConfig{}};
    const auto        result = validator.validate(with_estimates(5, 6.0, 6.5));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_valid);
    EXPECT_EQ(result->recommendation, "MPG validated - Kalman estimate matches ECU");
}

TEST(MpgCrossValidatorTest, AveragesOnlyTheRetainedWindow)
{
    MpgCrossValidator validator{CrossValidationConfig{}};
    auto              truck = with_estimates(10, 100.0, 100.0);
    for (int i = 0; i < 10; ++i) {
        truck.kalman_mpg.push(6.0);
        truck.ecu_mpg.push(6.0);
    }

    const auto result = validator.validate(truck);
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->kalman_mpg_avg, 6.0);
    EXPECT_DOUBLE_EQ(result->difference_pct, 0.0);
}

int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
