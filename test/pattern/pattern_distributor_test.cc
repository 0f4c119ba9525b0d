#include <gtest/gtest.h>
#include "../../src/pattern/pattern_distributor.h"

using namespace JitFhss;

class PatternDistributorTest : public ::testing::Test {
protected:
    void SetUp() override {
        PatternSourceOptions options;
        options.jam_probability = 0.0;
        source_ = std::make_unique<PatternSource>(options, std::make_shared<SeededRandomSource>(7));
        distributor_ = std::make_unique<PatternDistributor>(*source_);
    }

    std::unique_ptr<PatternSource> source_;
    std::unique_ptr<PatternDistributor> distributor_;
    PatternBuffer satellite_{50, 10};
    PatternBuffer ground_{50, 10};
};

TEST_F(PatternDistributorTest, DeliversIdenticalPatternsToEveryBuffer) {
    distributor_->AddDestination("satellite", satellite_, 0.002);
    distributor_->AddDestination("ground", ground_, 0.001);

    EXPECT_EQ(distributor_->Distribute(20, 5.0), 20u);
    ASSERT_EQ(satellite_.Size(), 20u);
    ASSERT_EQ(ground_.Size(), 20u);

    for (size_t i = 0; i < 20; ++i) {
        const Pattern& a = satellite_.Contents()[i];
        const Pattern& b = ground_.Contents()[i];
        EXPECT_EQ(a, b);
        EXPECT_DOUBLE_EQ(a.timestamp, 5.002);
        EXPECT_DOUBLE_EQ(b.timestamp, 5.001);
    }
    EXPECT_EQ(distributor_->stats().generated, 20u);
    EXPECT_EQ(distributor_->stats().delivered, 40u);
}

TEST_F(PatternDistributorTest, DelayIsEvaluatedPerBatch) {
    double delay = 0.010;
    int calls = 0;
    distributor_->AddDestination("satellite", satellite_, [&]() {
        ++calls;
        return delay;
    });

    distributor_->Distribute(5, 0.0);
    delay = 0.020;
    distributor_->Distribute(5, 1.0);

    EXPECT_EQ(calls, 2);
    EXPECT_DOUBLE_EQ(satellite_.Contents().front().timestamp, 0.010);
    EXPECT_DOUBLE_EQ(satellite_.Contents().back().timestamp, 1.020);
}

TEST_F(PatternDistributorTest, CountsRejections) {
    distributor_->AddDestination("satellite", satellite_, 0.0);
    distributor_->AddDestination("ground", ground_, 0.0);

    // Ground already saw a newer sequence number
    Pattern future;
    future.sequence_number = 3;
    future.frequency = 2.0e9;
    ASSERT_TRUE(ground_.Add(future));

    EXPECT_EQ(distributor_->Distribute(5, 0.0), 2u);
    EXPECT_EQ(distributor_->stats().rejected, 3u);
    EXPECT_EQ(satellite_.Size(), 5u);
    EXPECT_EQ(ground_.Size(), 3u);
}

TEST_F(PatternDistributorTest, MinRemainingTracksLowestBuffer) {
    distributor_->AddDestination("satellite", satellite_, 0.0);
    distributor_->AddDestination("ground", ground_, 0.0);
    distributor_->Distribute(10, 0.0);

    for (int i = 0; i < 4; ++i) {
        ground_.Next(0.0);
    }
    EXPECT_EQ(distributor_->MinRemaining(), 6u);
}
