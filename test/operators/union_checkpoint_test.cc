#include <gtest/gtest.h>
#include "../../src/operators/union_pipe.h"
#include "../test_utils.h"
#include <sstream>

using namespace Estuary;
using namespace Estuary::test;

using Pipe = UnionPipe<Empty, std::string>;

class UnionCheckpointTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().resetToDefaults();
        pool_ = std::make_shared<TestPool>(16, 16, true);
        observer_ = std::make_shared<CollectingObserver>(pool_);
    }

    // Leaves a, P@1, c buffered, left cursor at b@4, watermark at 1
    void BuildState(Pipe& pipe) {
        pipe.OnNextLeft(MakeBatch(*pool_, {Data(1, "a"), Punct(1), Data(4, "b")}));
        pipe.OnNextRight(MakeBatch(*pool_, {Data(2, "c")}));
        ASSERT_EQ(pipe.CurrentlyBufferedOutputCount(), 3u);
    }

    std::shared_ptr<TestPool> pool_;
    std::shared_ptr<CollectingObserver> observer_;
};

TEST_F(UnionCheckpointTest, RestoredOperatorEmitsSameBufferedRows) {
    std::stringstream state;
    {
        Pipe pipe(StreamProperties{}, observer_, pool_);
        BuildState(pipe);
        ASSERT_TRUE(pipe.Checkpoint(state));
        pipe.Dispose();
    }

    auto observer = std::make_shared<CollectingObserver>(pool_);
    Pipe restored(StreamProperties{}, observer, pool_);
    ASSERT_TRUE(restored.Restore(state));

    EXPECT_EQ(restored.CurrentlyBufferedOutputCount(), 3u);
    EXPECT_EQ(restored.next_left_time(), 4);
    EXPECT_EQ(restored.next_right_time(), 2);
    EXPECT_EQ(restored.watermark(), 1);

    restored.OnFlush();
    ASSERT_EQ(observer->batches.size(), 1u);
    EXPECT_EQ(observer->batches[0], (std::vector<Row>{Data(1, "a"), Punct(1), Data(2, "c")}));
    restored.Dispose();
}

TEST_F(UnionCheckpointTest, RestoredWatermarkStillSuppresses) {
    std::stringstream state;
    {
        Pipe pipe(StreamProperties{}, observer_, pool_);
        BuildState(pipe);
        ASSERT_TRUE(pipe.Checkpoint(state));
        pipe.Dispose();
    }

    auto observer = std::make_shared<CollectingObserver>(pool_);
    Pipe restored(StreamProperties{}, observer, pool_);
    ASSERT_TRUE(restored.Restore(state));

    restored.OnNextLeft(MakeBatch(*pool_, {Punct(1), Data(5, "d")}));
    restored.OnCompletedLeft();
    restored.OnCompletedRight();

    EXPECT_EQ(observer->VisibleRows(), (std::vector<Row>{Data(1, "a"), Punct(1), Data(2, "c"), Data(5, "d")}));
    EXPECT_EQ(restored.stats().punctuations_suppressed, 1u);
    restored.Dispose();
}

TEST_F(UnionCheckpointTest, EmptyOperatorRoundTrips) {
    std::stringstream state;
    Pipe pipe(StreamProperties{}, observer_, pool_);
    ASSERT_TRUE(pipe.Checkpoint(state));
    EXPECT_EQ(state.str().size(), sizeof(checkpoint::StateHeader));

    Pipe restored(StreamProperties{}, observer_, pool_);
    ASSERT_TRUE(restored.Restore(state));
    EXPECT_EQ(restored.CurrentlyBufferedOutputCount(), 0u);
    EXPECT_EQ(restored.watermark(), kMinSyncTime);
    EXPECT_EQ(restored.next_left_time(), kMinSyncTime);
}

TEST_F(UnionCheckpointTest, RejectsBadMagic) {
    std::stringstream state;
    Pipe pipe(StreamProperties{}, observer_, pool_);
    BuildState(pipe);
    ASSERT_TRUE(pipe.Checkpoint(state));

    std::string bytes = state.str();
    bytes[0] ^= 0x5a;
    std::stringstream corrupt(bytes);

    Pipe restored(StreamProperties{}, observer_, pool_);
    EXPECT_FALSE(restored.Restore(corrupt));
    EXPECT_EQ(restored.CurrentlyBufferedOutputCount(), 0u);
    EXPECT_EQ(restored.watermark(), kMinSyncTime);
    pipe.Dispose();
}

TEST_F(UnionCheckpointTest, RejectsTruncatedState) {
    std::stringstream state;
    Pipe pipe(StreamProperties{}, observer_, pool_);
    BuildState(pipe);
    ASSERT_TRUE(pipe.Checkpoint(state));
    pipe.Dispose();

    std::string bytes = state.str();
    size_t outstanding = pool_->GetOutstandingCount();

    Pipe header_only(StreamProperties{}, observer_, pool_);
    std::stringstream short_header(bytes.substr(0, sizeof(checkpoint::StateHeader) - 1));
    EXPECT_FALSE(header_only.Restore(short_header));

    Pipe short_body(StreamProperties{}, observer_, pool_);
    std::stringstream truncated(bytes.substr(0, bytes.size() - 4));
    EXPECT_FALSE(short_body.Restore(truncated));
    EXPECT_EQ(short_body.CurrentlyBufferedOutputCount(), 0u);
    EXPECT_EQ(short_body.next_left_time(), kMinSyncTime);

    // Scratch batch from the failed restore went back to the pool
    EXPECT_EQ(pool_->GetOutstandingCount(), outstanding + 2);
}

TEST_F(UnionCheckpointTest, RejectsBufferLargerThanOutputCapacity) {
    std::stringstream state;
    Pipe pipe(StreamProperties{}, observer_, pool_);
    BuildState(pipe);
    ASSERT_TRUE(pipe.Checkpoint(state));
    pipe.Dispose();

    auto small_pool = std::make_shared<TestPool>(2, 4, true);
    auto observer = std::make_shared<CollectingObserver>(small_pool);
    Pipe restored(StreamProperties{}, observer, small_pool);
    EXPECT_FALSE(restored.Restore(state));
    restored.Dispose();
}
