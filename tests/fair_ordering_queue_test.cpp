// =============================================================================
// fair_ordering_queue_test.cpp
// =============================================================================
// Unit tests for settle::FairOrderingQueue: FIFO positions, head
// eligibility, reinstatement after a dispute, restore.
// =============================================================================

#include "settle/domain/errors.hpp"
#include "settle/queue/fair_ordering_queue.hpp"

#include <gtest/gtest.h>

class FairOrderingQueueTest : public ::testing::Test {
 protected:
  settle::FairOrderingQueue queue;
};

TEST_F(FairOrderingQueueTest, EmptyQueueHasNoHead) {
  EXPECT_FALSE(queue.head().has_value());
  EXPECT_EQ(queue.length(), 0u);
  EXPECT_EQ(queue.nextPosition(), 0u);
  EXPECT_FALSE(queue.isHead(1));
}

TEST_F(FairOrderingQueueTest, PositionsFollowInitiationOrder) {
  EXPECT_EQ(queue.enqueue(10), 0u);
  EXPECT_EQ(queue.enqueue(3), 1u);
  EXPECT_EQ(queue.enqueue(7), 2u);

  EXPECT_EQ(queue.head(), 10u);
  EXPECT_EQ(queue.positionOf(10), 0u);
  EXPECT_EQ(queue.length(), 3u);
  EXPECT_TRUE(queue.isHead(10));
  EXPECT_FALSE(queue.isHead(3));
}

TEST_F(FairOrderingQueueTest, AdvanceFreesTheHead) {
  queue.enqueue(1);
  queue.enqueue(2);

  queue.advance(1);
  EXPECT_EQ(queue.head(), 2u);
  EXPECT_EQ(queue.length(), 1u);

  // Positions are never reissued.
  EXPECT_EQ(queue.enqueue(3), 2u);
}

TEST_F(FairOrderingQueueTest, AdvancingNonHeadKeepsHead) {
  queue.enqueue(1);
  queue.enqueue(2);
  queue.enqueue(3);

  queue.advance(2);
  EXPECT_EQ(queue.head(), 1u);
  queue.advance(1);
  EXPECT_EQ(queue.head(), 3u);

  EXPECT_NO_THROW(queue.advance(99));
}

TEST_F(FairOrderingQueueTest, DoubleEnqueueIsRejected) {
  queue.enqueue(1);
  EXPECT_THROW(queue.enqueue(1), settle::InvalidStateError);
  EXPECT_EQ(queue.nextPosition(), 1u);
}

// -----------------------------------------------------------------------------
// A settlement reinstated after a dispute goes back ahead of later ones.
// -----------------------------------------------------------------------------
TEST_F(FairOrderingQueueTest, ReinstateRestoresOriginalPosition) {
  queue.enqueue(1);  // position 0
  queue.enqueue(2);  // position 1

  queue.advance(1);
  EXPECT_EQ(queue.head(), 2u);

  queue.reinstate(1, 0);
  EXPECT_EQ(queue.head(), 1u);
  EXPECT_EQ(queue.positionOf(1), 0u);
  EXPECT_EQ(queue.length(), 2u);
}

TEST_F(FairOrderingQueueTest, ReinstateRejectsInvalidPositions) {
  queue.enqueue(1);
  queue.enqueue(2);

  EXPECT_THROW(queue.reinstate(3, 5), settle::InvalidStateError);  // not issued
  EXPECT_THROW(queue.reinstate(3, 1), settle::InvalidStateError);  // taken
  EXPECT_THROW(queue.reinstate(2, 0), settle::InvalidStateError);  // queued
}

TEST_F(FairOrderingQueueTest, RestoreRebuildsEntriesAndCounter) {
  queue.enqueue(1);
  queue.enqueue(2);
  queue.enqueue(3);
  queue.advance(1);

  settle::FairOrderingQueue restored;
  restored.restore(queue.entries(), queue.nextPosition());

  EXPECT_EQ(restored.head(), 2u);
  EXPECT_EQ(restored.length(), 2u);
  EXPECT_EQ(restored.enqueue(4), 3u);
}
