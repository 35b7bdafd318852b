// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for settle::ThreadSafeQueue<T>, the hand-off between threads
// that commit settlement operations and the IPC telemetry thread.
//
// Validates:
//   - FIFO order and size()
//   - try_pop() never blocks
//   - pop() waits for a producer
//   - Event variants survive the queue intact
//   - No loss or duplication under concurrent producers and consumers
// =============================================================================

#include "settle/concurrent/thread_safe_queue.hpp"
#include "settle/events/event.hpp"
#include "settle/events/event_types.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  settle::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Empty on construction, size tracks pushes and pops.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, SizeTracksContents) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);

  queue.push(1);
  queue.push(2);
  EXPECT_EQ(queue.size(), 2u);

  queue.pop();
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_FALSE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they were pushed.
// Why: telemetry subscribers rely on notifications arriving in commit order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() on an empty queue returns std::nullopt immediately.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(99);
  std::optional<int> result = queue.try_pop();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 99);
}

// -----------------------------------------------------------------------------
// 4. pop() blocks until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 5. A settlement notification keeps its alternative and payload.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, EventVariantRoundTrip) {
  settle::ThreadSafeQueue<settle::Event> events;

  settle::TransfersExecutedEvent executed;
  executed.settlement_id = 7;
  executed.first_index = 3;
  executed.count = 2;
  executed.amount_released = 500;
  executed.sequence_id = 41;
  events.push(executed);

  auto popped = events.try_pop();
  ASSERT_TRUE(popped.has_value());
  const auto* e = std::get_if<settle::TransfersExecutedEvent>(&*popped);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->settlement_id, 7u);
  EXPECT_EQ(e->first_index, 3u);
  EXPECT_EQ(e->count, 2u);
  EXPECT_EQ(e->amount_released, 500u);
  EXPECT_EQ(e->sequence_id, 41u);
}

// -----------------------------------------------------------------------------
// 6. Four producers, four consumers: every item popped exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        if (auto item = queue.try_pop()) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
