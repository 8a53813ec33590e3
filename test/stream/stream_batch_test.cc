#include <gtest/gtest.h>
#include "../../src/stream/stream_batch.h"
#include <string>

using namespace Estuary;

using Batch = StreamBatch<Empty, std::string>;

TEST(StreamBatchTest, AddFillsEveryColumn) {
    Batch batch(4);
    size_t i = batch.Add(7, kInfinitySyncTime, Empty(), "x", 99);

    EXPECT_EQ(i, 0u);
    EXPECT_EQ(batch.Count(), 1u);
    EXPECT_EQ(batch.vsync[0], 7);
    EXPECT_EQ(batch.vother[0], kInfinitySyncTime);
    EXPECT_EQ(batch.payload[0], "x");
    EXPECT_EQ(batch.hash[0], 99);
    EXPECT_FALSE(batch.IsDeleted(0));
}

TEST(StreamBatchTest, PunctuationIsVisibleEvenWhenDeleted) {
    Batch batch(4);
    batch.Add(1, kInfinitySyncTime, Empty(), "a", 0);
    batch.AddPunctuation(2);
    batch.SetDeleted(0);
    batch.SetDeleted(1);

    EXPECT_FALSE(batch.IsVisible(0));
    EXPECT_TRUE(batch.IsVisible(1));
    EXPECT_TRUE(IsPunctuation(batch.vother[1]));
    EXPECT_FALSE(IsDataEvent(batch.vother[1]));
}

TEST(StreamBatchTest, IntervalAndEndEdgesAreDataEvents) {
    EXPECT_TRUE(IsDataEvent(0));
    EXPECT_TRUE(IsDataEvent(15));
    EXPECT_TRUE(IsDataEvent(kInfinitySyncTime));
    EXPECT_FALSE(IsDataEvent(kPunctuationOtherTime));
}

TEST(StreamBatchTest, BitvectorSpansWords) {
    Batch batch(130);
    for (int64_t t = 0; t < 130; ++t) batch.Add(t, kInfinitySyncTime, Empty(), "", 0);
    batch.SetDeleted(63);
    batch.SetDeleted(64);
    batch.SetDeleted(129);

    EXPECT_EQ(batch.bitvector.size(), 3u);
    EXPECT_TRUE(batch.IsDeleted(63));
    EXPECT_TRUE(batch.IsDeleted(64));
    EXPECT_TRUE(batch.IsDeleted(129));
    EXPECT_FALSE(batch.IsDeleted(62));
    EXPECT_FALSE(batch.IsDeleted(128));
}

TEST(StreamBatchTest, AllocateResetsForReuse) {
    Batch batch(2);
    batch.Add(1, kInfinitySyncTime, Empty(), "a", 0);
    batch.AddPunctuation(3);
    batch.SetDeleted(0);
    batch.iter = 2;
    batch.Seal();
    EXPECT_TRUE(batch.IsFull());

    batch.Allocate();

    EXPECT_EQ(batch.Count(), 0u);
    EXPECT_EQ(batch.iter, 0u);
    EXPECT_FALSE(batch.IsSealed());
    EXPECT_FALSE(batch.IsDeleted(0));
    EXPECT_EQ(batch.Capacity(), 2u);
}
