#include <gtest/gtest.h>
#include "../../src/pattern/pattern_buffer.h"

using namespace JitFhss;

namespace {

Pattern MakePattern(uint64_t seq, double freq = 0.0) {
    Pattern p;
    p.sequence_number = seq;
    p.frequency = freq > 0.0 ? freq : 2.0e9 + seq * 1.0e6;
    p.source_id = 1;
    return p;
}

} // namespace

class PatternBufferTest : public ::testing::Test {
protected:
    void Fill(PatternBuffer& buffer, uint64_t first, uint64_t last) {
        for (uint64_t seq = first; seq <= last; ++seq) {
            ASSERT_TRUE(buffer.Add(MakePattern(seq)));
        }
    }
};

TEST_F(PatternBufferTest, ConsumesInSequenceOrder) {
    PatternBuffer buffer(10, 2);
    Fill(buffer, 1, 5);

    EXPECT_EQ(buffer.Remaining(), 5u);
    for (uint64_t seq = 1; seq <= 5; ++seq) {
        EXPECT_EQ(buffer.Next(0.0).sequence_number, seq);
    }
    EXPECT_EQ(buffer.Remaining(), 0u);
}

TEST_F(PatternBufferTest, RejectsDuplicatesAndStalePatterns) {
    PatternBuffer buffer(10, 2);
    Fill(buffer, 1, 3);

    EXPECT_FALSE(buffer.Add(MakePattern(3)));
    EXPECT_FALSE(buffer.Add(MakePattern(2)));
    EXPECT_FALSE(buffer.Add(Pattern{}));
    EXPECT_TRUE(buffer.Add(MakePattern(7)));

    EXPECT_EQ(buffer.Size(), 4u);
    EXPECT_EQ(buffer.max_sequence_seen(), 7u);
    EXPECT_EQ(buffer.GetStatus().rejected, 3u);
}

TEST_F(PatternBufferTest, SequenceNumbersStrictlyIncrease) {
    PatternBuffer buffer(20, 2);
    const uint64_t arrivals[] = {4, 2, 9, 9, 5, 12, 11, 13};
    for (uint64_t seq : arrivals) {
        buffer.Add(MakePattern(seq));
    }
    const auto& contents = buffer.Contents();
    for (size_t i = 1; i < contents.size(); ++i) {
        EXPECT_LT(contents[i - 1].sequence_number, contents[i].sequence_number);
    }
    EXPECT_EQ(contents.size(), 4u); // 4, 9, 12, 13
}

TEST_F(PatternBufferTest, ExhaustedBufferRepeatsLastPattern) {
    PatternBuffer buffer(5, 1);
    Fill(buffer, 1, 3);
    for (int i = 0; i < 3; ++i) {
        buffer.Next(0.0);
    }

    Pattern repeated = buffer.Next(1.0);
    EXPECT_EQ(repeated.sequence_number, 3u);
    EXPECT_TRUE(buffer.IsExhausted());
    EXPECT_EQ(buffer.Next(2.0).sequence_number, 3u);
    EXPECT_EQ(buffer.GetStatus().exhaustions, 2u);
}

TEST_F(PatternBufferTest, EmptyBufferReturnsInvalidPattern) {
    PatternBuffer buffer(5, 1);
    Pattern p = buffer.Next(0.0);
    EXPECT_FALSE(p.IsValid());
    EXPECT_TRUE(buffer.IsExhausted());
}

TEST_F(PatternBufferTest, ResumesAfterRefillingAnExhaustedBuffer) {
    PatternBuffer buffer(5, 1);
    Fill(buffer, 1, 1);
    buffer.Next(0.0);
    buffer.Next(0.1);
    ASSERT_TRUE(buffer.IsExhausted());

    ASSERT_TRUE(buffer.Add(MakePattern(2)));
    EXPECT_FALSE(buffer.IsExhausted());
    EXPECT_EQ(buffer.Next(0.2).sequence_number, 2u);
}

TEST_F(PatternBufferTest, OverflowDropsConsumedPatternsFirst) {
    PatternBuffer buffer(3, 1);
    Fill(buffer, 1, 3);
    buffer.Next(0.0);
    buffer.Next(0.0);

    ASSERT_TRUE(buffer.Add(MakePattern(4)));
    EXPECT_EQ(buffer.Size(), 3u);
    EXPECT_EQ(buffer.Remaining(), 2u);
    EXPECT_EQ(buffer.Next(0.0).sequence_number, 3u);
    EXPECT_EQ(buffer.Next(0.0).sequence_number, 4u);
    EXPECT_EQ(buffer.GetStatus().dropped, 1u);
}

TEST_F(PatternBufferTest, OverflowNeverExceedsCapacity) {
    PatternBuffer buffer(3, 1);
    Fill(buffer, 1, 5);

    EXPECT_EQ(buffer.Size(), 3u);
    EXPECT_EQ(buffer.GetStatus().dropped, 2u);
    // The pattern under the cursor survives trimming
    EXPECT_EQ(buffer.Next(0.0).sequence_number, 1u);
    EXPECT_EQ(buffer.max_sequence_seen(), 5u);
}

TEST_F(PatternBufferTest, CompactRemovesConsumedPatterns) {
    PatternBuffer buffer(10, 2);
    Fill(buffer, 1, 5);
    buffer.Next(0.0);
    buffer.Next(0.0);

    buffer.Compact();
    EXPECT_EQ(buffer.Size(), 3u);
    EXPECT_EQ(buffer.Remaining(), 3u);
    EXPECT_EQ(buffer.GetStatus().cursor, 0u);
    EXPECT_EQ(buffer.Next(0.0).sequence_number, 3u);
}

TEST_F(PatternBufferTest, CompactKeepsLastPatternWhenExhausted) {
    PatternBuffer buffer(10, 2);
    Fill(buffer, 1, 2);
    for (int i = 0; i < 3; ++i) {
        buffer.Next(0.0);
    }

    buffer.Compact();
    EXPECT_EQ(buffer.Size(), 1u);
    EXPECT_EQ(buffer.Remaining(), 0u);
    EXPECT_EQ(buffer.Next(1.0).sequence_number, 2u);
}

TEST_F(PatternBufferTest, LowBufferCallbackFires) {
    PatternBuffer buffer(10, 3);
    std::vector<size_t> reported;
    buffer.SetLowBufferCallback([&reported](size_t remaining) { reported.push_back(remaining); });
    Fill(buffer, 1, 5);

    buffer.Next(0.0);
    buffer.Next(0.0);
    EXPECT_FALSE(buffer.IsLow());
    EXPECT_TRUE(reported.empty());

    buffer.Next(0.0);
    EXPECT_TRUE(buffer.IsLow());
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], 2u);
}

TEST_F(PatternBufferTest, ResetKeepsDuplicateGate) {
    PatternBuffer buffer(10, 2);
    Fill(buffer, 1, 4);
    buffer.Reset();

    EXPECT_EQ(buffer.Size(), 0u);
    EXPECT_FALSE(buffer.Add(MakePattern(3)));
    EXPECT_TRUE(buffer.Add(MakePattern(5)));
}

TEST_F(PatternBufferTest, CapacityAndWatermarkAreClamped) {
    PatternBuffer buffer(0, 5);
    EXPECT_EQ(buffer.capacity(), 1u);
    EXPECT_EQ(buffer.low_watermark(), 1u);
}

TEST_F(PatternBufferTest, InterleavedAddAndNextConsumeMonotonically) {
    PatternBuffer buffer(8, 1);
    std::vector<uint64_t> consumed;
    auto next = [&](double t) { consumed.push_back(buffer.Next(t).sequence_number); };

    Fill(buffer, 1, 2);
    next(0.0);
    ASSERT_TRUE(buffer.Add(MakePattern(3)));
    next(1.0);
    ASSERT_TRUE(buffer.Add(MakePattern(5)));
    EXPECT_FALSE(buffer.Add(MakePattern(4)));
    next(2.0);
    next(3.0);
    // Drained: the last pattern repeats until a refill arrives
    next(4.0);
    ASSERT_TRUE(buffer.Add(MakePattern(6)));
    next(5.0);

    EXPECT_EQ(consumed, (std::vector<uint64_t>{1, 2, 3, 5, 5, 6}));
    for (size_t i = 1; i < consumed.size(); ++i) {
        EXPECT_LE(consumed[i - 1], consumed[i]);
    }
    EXPECT_EQ(buffer.GetStatus().exhaustions, 1u);
}

class ExhaustedBufferTest : public ::testing::TestWithParam<int> {};

TEST_P(ExhaustedBufferTest, RepeatsLastPatternOnceDrained) {
    const uint64_t size = static_cast<uint64_t>(GetParam());
    PatternBuffer buffer(8, 1);
    for (uint64_t seq = 1; seq <= size; ++seq) {
        ASSERT_TRUE(buffer.Add(MakePattern(seq)));
    }
    for (uint64_t seq = 1; seq <= size; ++seq) {
        EXPECT_EQ(buffer.Next(0.0).sequence_number, seq);
    }

    for (int i = 0; i < 3; ++i) {
        const Pattern p = buffer.Next(1.0 + i);
        EXPECT_TRUE(buffer.IsExhausted());
        if (size == 0) {
            EXPECT_FALSE(p.IsValid());
        } else {
            EXPECT_EQ(p.sequence_number, size);
        }
    }
    EXPECT_EQ(buffer.Remaining(), 0u);
}

INSTANTIATE_TEST_SUITE_P(BufferSizes, ExhaustedBufferTest, ::testing::Range(0, 9));
