#include <gtest/gtest.h>
#include "../../src/channel/doppler_compensator.h"

using namespace JitFhss;

TEST(DopplerCompensatorTest, ShiftAtFourKilometersPerSecond) {
    DopplerCompensator doppler;
    const double shift = doppler.Shift(2.05e9, 4.0);
    EXPECT_NEAR(shift, 27351.0, 27351.0 * 0.01);
    EXPECT_GT(shift, 0.0);
}

TEST(DopplerCompensatorTest, RecedingSatelliteIsRedShifted) {
    DopplerCompensator doppler;
    EXPECT_LT(doppler.Apply(2.05e9, -4.0), 2.05e9);
    EXPECT_GT(doppler.Apply(2.05e9, 4.0), 2.05e9);
    EXPECT_DOUBLE_EQ(doppler.Apply(2.05e9, 0.0), 2.05e9);
}

TEST(DopplerCompensatorTest, CompensationInvertsApply) {
    DopplerCompensator doppler;
    const double tx = 2.0731e9;
    for (double range_rate : {-7.5, -1.0, 0.0, 3.2, 7.5}) {
        const double rx = doppler.Apply(tx, range_rate);
        EXPECT_NEAR(doppler.Compensate(rx, range_rate, tx), tx, 1e-3);
    }
}

TEST(DopplerCompensatorTest, DisabledCompensationPassesThrough) {
    DopplerCompensator doppler;
    doppler.SetCompensation(false);
    EXPECT_FALSE(doppler.compensation_enabled());

    const double rx = doppler.Apply(2.05e9, 5.0);
    EXPECT_DOUBLE_EQ(doppler.Compensate(rx, 5.0, 2.05e9), rx);
}

TEST(DopplerCompensatorTest, MaxShiftIsMagnitude) {
    DopplerCompensator doppler;
    EXPECT_DOUBLE_EQ(doppler.MaxShift(2.05e9, -7.6), doppler.Shift(2.05e9, 7.6));
}

TEST(DopplerCompensatorTest, PropagationDelay) {
    DopplerCompensator doppler;
    EXPECT_NEAR(doppler.PropagationDelay(2998.0), 0.01, 1e-12);
    EXPECT_NEAR(doppler.RoundTripDelay(2998.0), 0.02, 1e-12);
}
