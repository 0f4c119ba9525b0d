#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/channel/channel_quality.h"
#include "../test_doubles.h"

using namespace JitFhss;
using ::testing::NiceMock;
using ::testing::Return;

class ChannelQualityTest : public ::testing::Test {
protected:
    void SetUp() override {
        random_ = std::make_shared<NiceMock<MockRandomSource>>();
        // No clouds, no rain, no scintillation
        ON_CALL(*random_, Uniform()).WillByDefault(Return(0.5));
        ON_CALL(*random_, Normal()).WillByDefault(Return(0.0));
        model_ = std::make_unique<ChannelQualityModel>(options_, random_,
                                                       ClockGrade::Ideal(), ClockGrade::Ideal());
    }

    LinkBudgetOptions options_;
    std::shared_ptr<NiceMock<MockRandomSource>> random_;
    std::unique_ptr<ChannelQualityModel> model_;
};

TEST_F(ChannelQualityTest, FreeSpacePathLoss) {
    EXPECT_NEAR(model_->FreeSpacePathLoss(1000.0), 158.683, 0.01);
    // Doubling the range costs 6 dB
    EXPECT_NEAR(model_->FreeSpacePathLoss(2000.0) - model_->FreeSpacePathLoss(1000.0), 6.0206, 1e-3);
}

TEST_F(ChannelQualityTest, ThermalNoisePower) {
    EXPECT_NEAR(model_->NoisePower(), -143.976, 0.01);
}

TEST_F(ChannelQualityTest, LinkBudgetBreakdown) {
    SnrBreakdown b = model_->Snr(1000.0, 90.0);
    EXPECT_DOUBLE_EQ(b.eirp_dbw, 25.0);
    EXPECT_DOUBLE_EQ(b.rain_db, 0.0);
    EXPECT_NEAR(b.atmospheric_db, 0.2, 1e-9);
    EXPECT_NEAR(b.ionospheric_db, 0.5 / (2.05 * 2.05), 1e-9);
    EXPECT_NEAR(b.snr_db, b.rx_power_dbw - b.noise_power_dbw, 1e-9);
    EXPECT_NEAR(b.snr_db, 25.0 - 158.683 - 0.2 - 0.119 + 25.0 + 143.976, 0.02);
}

TEST_F(ChannelQualityTest, SnrFallsWithRange) {
    double previous = model_->SnrDb(500.0, 45.0);
    for (double range : {800.0, 1500.0, 2500.0, 4000.0}) {
        const double snr = model_->SnrDb(range, 45.0);
        EXPECT_LT(snr, previous);
        previous = snr;
    }
}

TEST_F(ChannelQualityTest, SnrRisesWithElevation) {
    EXPECT_LT(model_->SnrDb(1500.0, 5.0), model_->SnrDb(1500.0, 30.0));
    EXPECT_LT(model_->SnrDb(1500.0, 30.0), model_->SnrDb(1500.0, 85.0));
}

TEST_F(ChannelQualityTest, ImpairmentsAreApplied) {
    // Clouds and rain both hit
    ON_CALL(*random_, Uniform()).WillByDefault(Return(0.05));
    ON_CALL(*random_, Normal()).WillByDefault(Return(-2.0));

    EXPECT_NEAR(model_->AtmosphericLoss(90.0), 0.2 + 0.05 * 2.0, 1e-9);
    EXPECT_NEAR(model_->IonosphericLoss(90.0), 0.5 / (2.05 * 2.05) + 0.6, 1e-9);
    EXPECT_NEAR(model_->RainFade(90.0), 1e-4 * 0.5 * 3.0, 1e-12);
    // Low elevation lengthens the ionospheric path
    EXPECT_GT(model_->IonosphericLoss(10.0), model_->IonosphericLoss(20.0));
}

TEST_F(ChannelQualityTest, IdealClocksAgree) {
    EXPECT_EQ(model_->ClockError(0.0), 0.0);
    EXPECT_EQ(model_->ClockError(3600.0), 0.0);
}

TEST(ChannelQualityClockTest, ClockErrorIsReceiverMinusSender) {
    auto random = std::make_shared<SeededRandomSource>(11);
    ChannelQualityModel model(LinkBudgetOptions{}, random);
    model.sender_clock() = ClockModel(2e-6, 0.0, 0.0);
    model.receiver_clock() = ClockModel(5e-7, 1e-9, 0.0);

    EXPECT_NEAR(model.ClockError(0.0), -1.5e-6, 1e-18);
    EXPECT_NEAR(model.ClockError(100.0), -1.5e-6 + 1e-7, 1e-18);
}

TEST(ChannelQualityClockTest, ResyncRemovesRelativeOffset) {
    auto random = std::make_shared<SeededRandomSource>(11);
    ChannelQualityModel model(LinkBudgetOptions{}, random);
    const double sender_before = model.sender_clock().Error(250.0);

    model.Resync(250.0);
    EXPECT_NEAR(model.ClockError(250.0), 0.0, 1e-15);
    EXPECT_NEAR(model.sender_clock().Error(250.0), sender_before, 1e-18);
}
