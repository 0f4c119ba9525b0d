#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/channel/clock_model.h"
#include "../test_doubles.h"

using namespace JitFhss;
using ::testing::Return;

TEST(ClockModelTest, QuadraticErrorModel) {
    ClockModel clock(1e-6, 1e-9, 1e-12);
    // 1e-6 + 1e-9 * 100 + 0.5 * 1e-12 * 100^2
    EXPECT_NEAR(clock.Error(100.0), 1.105e-6, 1e-15);
    EXPECT_NEAR(clock.DriftRate(100.0), 1e-9 + 1e-10, 1e-18);
    EXPECT_DOUBLE_EQ(clock.Error(0.0), 1e-6);
}

TEST(ClockModelTest, CoefficientsScaleWithGrade) {
    MockRandomSource random;
    EXPECT_CALL(random, Normal()).Times(3).WillRepeatedly(Return(2.0));

    ClockModel clock(ClockGrade::Satellite(), random);
    EXPECT_DOUBLE_EQ(clock.bias(), 2e-6);
    EXPECT_DOUBLE_EQ(clock.drift(), 2e-11);
    EXPECT_DOUBLE_EQ(clock.aging(), 2e-14);
    EXPECT_EQ(clock.grade_name(), "satellite");
}

TEST(ClockModelTest, IdealClockHasNoError) {
    SeededRandomSource random(3);
    ClockModel clock(ClockGrade::Ideal(), random);
    EXPECT_EQ(clock.Error(0.0), 0.0);
    EXPECT_EQ(clock.Error(1e6), 0.0);
}

TEST(ClockModelTest, GroundClockIsTighterThanSatellite) {
    const ClockGrade sat = ClockGrade::Satellite();
    const ClockGrade ground = ClockGrade::Ground();
    EXPECT_LT(ground.bias_sigma, sat.bias_sigma);
    EXPECT_LT(ground.drift_sigma, sat.drift_sigma);
    EXPECT_LT(ground.aging_sigma, sat.aging_sigma);
}

TEST(ClockModelTest, ResetPreservesContinuity) {
    ClockModel clock(1e-6, 1e-9, 1e-12);
    const double before = clock.Error(500.0);
    const double rate_before = clock.DriftRate(500.0);

    clock.Reset(500.0);
    EXPECT_DOUBLE_EQ(clock.epoch(), 500.0);
    EXPECT_NEAR(clock.Error(500.0), before, 1e-18);
    EXPECT_NEAR(clock.DriftRate(500.0), rate_before, 1e-21);
    // Aging keeps bending the curve after the new epoch
    EXPECT_NEAR(clock.Error(600.0), before + rate_before * 100.0 + 0.5 * 1e-12 * 1e4, 1e-15);
}

TEST(ClockModelTest, SyncRemovesCorrection) {
    ClockModel clock(3e-6, 2e-9, 0.0);
    const double offset = clock.Error(1000.0);

    clock.Sync(1000.0, offset);
    EXPECT_NEAR(clock.Error(1000.0), 0.0, 1e-18);
    EXPECT_NEAR(clock.Error(1010.0), 2e-8, 1e-18);
}
