// Repository: StreamTap
// Component: BackpressureQueue Contract Tests
// Purpose: Bounded FIFO under blocking and leaky policies, plus Close().
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "streamtap/buffer/BackpressureQueue.hpp"
#include "streamtap/runtime/Errors.hpp"

namespace streamtap::buffer::testing {
namespace {

using std::chrono::milliseconds;

// =============================================================================
// Construction
// =============================================================================

TEST(BackpressureQueueContract, ZeroCapacityIsRejected) {
  EXPECT_THROW(BackpressureQueue<int>(0, QueuePolicy::kBlock),
               ConfigurationError);
  EXPECT_THROW(BackpressureQueue<int>(0, QueuePolicy::kLeaky),
               ConfigurationError);
}

TEST(BackpressureQueueContract, ReportsConfiguration) {
  BackpressureQueue<int> queue(7, QueuePolicy::kLeaky);
  EXPECT_EQ(queue.Capacity(), 7u);
  EXPECT_EQ(queue.Policy(), QueuePolicy::kLeaky);
  EXPECT_TRUE(queue.Empty());
  EXPECT_EQ(queue.Size(), 0u);
  EXPECT_EQ(queue.Dropped(), 0u);
}

// =============================================================================
// FIFO
// =============================================================================

TEST(BackpressureQueueContract, PopsInInsertionOrder) {
  BackpressureQueue<int> queue(4, QueuePolicy::kBlock);
  for (int i = 0; i < 4; ++i) ASSERT_TRUE(queue.Put(i));
  for (int i = 0; i < 4; ++i) {
    auto item = queue.Pop(milliseconds(10));
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i);
  }
  EXPECT_EQ(queue.TotalPushed(), 4u);
  EXPECT_EQ(queue.TotalPopped(), 4u);
}

TEST(BackpressureQueueContract, PopTimesOutWhenEmpty) {
  BackpressureQueue<int> queue(1, QueuePolicy::kBlock);
  const auto start = std::chrono::steady_clock::now();
  auto item = queue.Pop(milliseconds(30));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(item.has_value());
  EXPECT_GE(elapsed, milliseconds(25));
}

TEST(BackpressureQueueContract, PopWakesOnPut) {
  BackpressureQueue<int> queue(1, QueuePolicy::kBlock);
  std::thread producer([&] {
    std::this_thread::sleep_for(milliseconds(20));
    queue.Put(42);
  });
  auto item = queue.Pop(milliseconds(2000));
  producer.join();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 42);
}

TEST(BackpressureQueueContract, TryPopNeverWaits) {
  BackpressureQueue<int> queue(2, QueuePolicy::kBlock);
  EXPECT_FALSE(queue.TryPop().has_value());
  ASSERT_TRUE(queue.Put(5));
  EXPECT_EQ(queue.TryPop().value_or(-1), 5);
  EXPECT_TRUE(queue.Empty());
}

// =============================================================================
// Leaky policy
// =============================================================================

// Capacity 2, leaky, Put(a), Put(b), Put(c) → Pop returns b then c, one drop.
TEST(BackpressureQueueContract, LeakyEvictsOldest) {
  std::vector<char> evicted;
  BackpressureQueue<char> queue(2, QueuePolicy::kLeaky,
                                [&](const char& c) { evicted.push_back(c); });
  EXPECT_TRUE(queue.Put('a'));
  EXPECT_TRUE(queue.Put('b'));
  EXPECT_TRUE(queue.Put('c'));

  EXPECT_EQ(queue.Size(), 2u);
  EXPECT_EQ(queue.Dropped(), 1u);
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], 'a');

  EXPECT_EQ(queue.Pop(milliseconds(10)).value_or('?'), 'b');
  EXPECT_EQ(queue.Pop(milliseconds(10)).value_or('?'), 'c');
  EXPECT_FALSE(queue.Pop(milliseconds(5)).has_value());
}

TEST(BackpressureQueueContract, LeakyNeverBlocksProducer) {
  BackpressureQueue<int> queue(3, QueuePolicy::kLeaky);
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 1000; ++i) ASSERT_TRUE(queue.Put(i));
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(500));

  EXPECT_EQ(queue.Size(), 3u);
  EXPECT_EQ(queue.Dropped(), 997u);
  EXPECT_EQ(queue.Pop(milliseconds(1)).value_or(-1), 997);
}

// =============================================================================
// Blocking policy
// =============================================================================

TEST(BackpressureQueueContract, BlockingPutWaitsForPop) {
  BackpressureQueue<int> queue(2, QueuePolicy::kBlock);
  ASSERT_TRUE(queue.Put(1));
  ASSERT_TRUE(queue.Put(2));

  std::atomic<bool> third_done{false};
  std::thread producer([&] {
    queue.Put(3);
    third_done = true;
  });

  std::this_thread::sleep_for(milliseconds(50));
  EXPECT_FALSE(third_done.load()) << "Put on a full blocking queue returned";
  EXPECT_EQ(queue.Size(), 2u);

  EXPECT_EQ(queue.Pop(milliseconds(10)).value_or(-1), 1);
  producer.join();
  EXPECT_TRUE(third_done.load());

  EXPECT_EQ(queue.Pop(milliseconds(10)).value_or(-1), 2);
  EXPECT_EQ(queue.Pop(milliseconds(10)).value_or(-1), 3);
  EXPECT_EQ(queue.Dropped(), 0u);
}

// =============================================================================
// Close
// =============================================================================

TEST(BackpressureQueueContract, CloseReleasesBlockedProducer) {
  BackpressureQueue<int> queue(1, QueuePolicy::kBlock);
  ASSERT_TRUE(queue.Put(1));

  std::atomic<int> result{-1};
  std::thread producer([&] { result = queue.Put(2) ? 1 : 0; });

  std::this_thread::sleep_for(milliseconds(30));
  EXPECT_EQ(result.load(), -1);
  queue.Close();
  producer.join();

  EXPECT_EQ(result.load(), 0);
  EXPECT_TRUE(queue.IsClosed());
  EXPECT_EQ(queue.Size(), 1u);
}

TEST(BackpressureQueueContract, ClosedQueueRejectsPutButDrains) {
  BackpressureQueue<int> queue(4, QueuePolicy::kLeaky);
  ASSERT_TRUE(queue.Put(1));
  ASSERT_TRUE(queue.Put(2));
  queue.Close();

  EXPECT_FALSE(queue.Put(3));
  EXPECT_EQ(queue.Pop(milliseconds(1)).value_or(-1), 1);
  EXPECT_EQ(queue.Pop(milliseconds(1)).value_or(-1), 2);
  EXPECT_FALSE(queue.Pop(milliseconds(1)).has_value());
}

}  // namespace
}  // namespace streamtap::buffer::testing
