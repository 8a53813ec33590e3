#include <gtest/gtest.h>
#include "../../src/operators/watermark_tracker.h"

using namespace Estuary;

TEST(WatermarkTrackerTest, AdvancesOnlyForward) {
    WatermarkTracker tracker;
    EXPECT_EQ(tracker.Current(), kMinSyncTime);

    EXPECT_TRUE(tracker.Advance(5));
    EXPECT_FALSE(tracker.Advance(5));
    EXPECT_FALSE(tracker.Advance(3));
    EXPECT_EQ(tracker.Current(), 5);

    EXPECT_TRUE(tracker.IsRedundant(5));
    EXPECT_TRUE(tracker.IsRedundant(-1));
    EXPECT_FALSE(tracker.IsRedundant(6));
}

TEST(WatermarkTrackerTest, RestoreReplacesValue) {
    WatermarkTracker tracker;
    tracker.Advance(100);
    tracker.Restore(7);
    EXPECT_EQ(tracker.Current(), 7);
    EXPECT_TRUE(tracker.Advance(8));
}
