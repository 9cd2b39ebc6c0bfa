#include <gtest/gtest.h>
#include "../../src/kernel/windowed_aggregator.h"
#include <stdexcept>

using namespace IsingSim;

class WindowedAggregatorTest : public ::testing::Test {
protected:
    static constexpr size_t kWindow = 60;
};

TEST_F(WindowedAggregatorTest, RejectsZeroWindow) {
    EXPECT_THROW(WindowedAggregator("bad", 0), std::invalid_argument);
}

TEST_F(WindowedAggregatorTest, ConstantStreamPublishesValueAtBoundary) {
    WindowedAggregator agg("upf", kWindow);
    for (size_t i = 0; i + 1 < kWindow; ++i) {
        EXPECT_FALSE(agg.RecordAndMaybeFlush(7.0));
    }
    // Not published yet, readers still see the initial value
    EXPECT_DOUBLE_EQ(agg.Output(), 0.0);
    EXPECT_EQ(agg.Flushes(), 0u);

    EXPECT_TRUE(agg.RecordAndMaybeFlush(7.0));
    EXPECT_DOUBLE_EQ(agg.Output(), 7.0);
    EXPECT_EQ(agg.Flushes(), 1u);
    EXPECT_EQ(agg.FrameCount(), 0u);
}

TEST_F(WindowedAggregatorTest, OldestSampleIsEvicted) {
    WindowedAggregator agg("upf", kWindow);
    agg.RecordAndMaybeFlush(1000.0);
    for (size_t i = 0; i < kWindow; ++i) {
        agg.RecordAndMaybeFlush(1.0);
    }
    // W + 1 recordings: the window holds only the last W samples
    const auto snapshot = agg.Snapshot();
    ASSERT_EQ(snapshot.size(), kWindow);
    for (double v : snapshot) {
        EXPECT_DOUBLE_EQ(v, 1.0);
    }
    // The boundary fell on the W-th recording, which still saw the 1000
    EXPECT_DOUBLE_EQ(agg.Output(), (1000.0 + 59.0) / 60.0);
    EXPECT_EQ(agg.FrameCount(), 1u);
}

TEST_F(WindowedAggregatorTest, OutputHeldBetweenFlushes) {
    WindowedAggregator agg("magnetization", 4);
    for (int i = 0; i < 4; ++i) {
        agg.RecordAndMaybeFlush(2.0);
    }
    EXPECT_DOUBLE_EQ(agg.Output(), 2.0);

    agg.RecordAndMaybeFlush(10.0);
    agg.RecordAndMaybeFlush(10.0);
    EXPECT_DOUBLE_EQ(agg.Output(), 2.0);

    agg.RecordAndMaybeFlush(10.0);
    EXPECT_TRUE(agg.RecordAndMaybeFlush(10.0));
    EXPECT_DOUBLE_EQ(agg.Output(), 10.0);
    EXPECT_EQ(agg.Flushes(), 2u);
}

TEST_F(WindowedAggregatorTest, SnapshotIsOldestFirst) {
    WindowedAggregator agg("upf", 3);
    agg.RecordAndMaybeFlush(1.0);
    agg.RecordAndMaybeFlush(2.0);
    agg.RecordAndMaybeFlush(3.0);
    agg.RecordAndMaybeFlush(4.0);
    const std::vector<double> expected{2.0, 3.0, 4.0};
    EXPECT_EQ(agg.Snapshot(), expected);
}

TEST_F(WindowedAggregatorTest, SumReduction) {
    WindowedAggregator agg("updates", 3, WindowedAggregator::Reduction::kSum);
    agg.RecordAndMaybeFlush(1.0);
    agg.RecordAndMaybeFlush(2.0);
    agg.RecordAndMaybeFlush(3.0);
    EXPECT_DOUBLE_EQ(agg.Output(), 6.0);
}

TEST_F(WindowedAggregatorTest, ResetClearsEverything) {
    WindowedAggregator agg("upf", 2);
    agg.RecordAndMaybeFlush(5.0);
    agg.RecordAndMaybeFlush(5.0);
    agg.RecordAndMaybeFlush(5.0);
    agg.Reset();
    EXPECT_DOUBLE_EQ(agg.Output(), 0.0);
    EXPECT_EQ(agg.FrameCount(), 0u);
    EXPECT_EQ(agg.Snapshot(), std::vector<double>(2, 0.0));
}
