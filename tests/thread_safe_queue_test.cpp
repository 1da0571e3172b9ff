// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tradebook::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order of queued fills (the ledger depends on arrival order)
//   - try_pop() on empty / non-empty queues, size() bookkeeping
//   - Move-only payloads
//   - Blocking pop() wakes up on push; pop_for() honours its timeout
//   - take_all() hands over the backlog in order
//   - No loss or duplication under several producers and consumers
//
// Threaded tests join every thread before asserting.
// =============================================================================

#include "tradebook/concurrent/thread_safe_queue.hpp"
#include "tradebook/domain/trade_event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. A fresh queue is empty and try_pop() returns nothing.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, EmptyOnConstruction) {
  tradebook::ThreadSafeQueue<int> queue;
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. Fills come out in the order they went in, with their data intact.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, FillsPreserveFifoOrder) {
  tradebook::ThreadSafeQueue<tradebook::domain::TradeEvent> queue;
  for (int i = 0; i < 50; ++i) {
    tradebook::domain::TradeEvent fill;
    fill.trade_id = "t" + std::to_string(i);
    fill.size = static_cast<double>(i + 1);
    queue.push(fill);
  }
  EXPECT_EQ(queue.size(), 50u);

  for (int i = 0; i < 50; ++i) {
    auto fill = queue.try_pop();
    ASSERT_TRUE(fill.has_value());
    EXPECT_EQ(fill->trade_id, "t" + std::to_string(i));
    EXPECT_DOUBLE_EQ(fill->size, static_cast<double>(i + 1));
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Move-only payloads are supported by both pop flavours.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, MoveOnlyPayload) {
  tradebook::ThreadSafeQueue<std::unique_ptr<int>> queue;
  queue.push(std::make_unique<int>(1));
  queue.push(std::make_unique<int>(2));

  auto first = queue.pop();
  auto second = queue.try_pop();
  ASSERT_TRUE(first);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, 1);
  EXPECT_EQ(**second, 2);
}

// -----------------------------------------------------------------------------
// 4. pop() blocks until a producer pushes.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, BlockingPopWakesOnPush) {
  tradebook::ThreadSafeQueue<int> queue;
  std::atomic<int> received{0};

  std::thread consumer([&] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), 0);

  queue.push(7);
  consumer.join();
  EXPECT_EQ(received.load(), 7);
}

// -----------------------------------------------------------------------------
// 5. pop_for() times out on an empty queue and returns early on a push.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, PopForTimesOutThenReceives) {
  tradebook::ThreadSafeQueue<int> queue;
  EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(5)).has_value());

  std::thread producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    queue.push(3);
  });
  auto value = queue.pop_for(std::chrono::seconds(2));
  producer.join();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 3);
}

// -----------------------------------------------------------------------------
// 6. take_all() empties the queue and keeps the order.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, TakeAllEmptiesInOrder) {
  tradebook::ThreadSafeQueue<int> queue;
  for (int i = 0; i < 4; ++i) {
    queue.push(i);
  }

  auto all = queue.take_all();

  EXPECT_TRUE(queue.empty());
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all.front(), 0);
  EXPECT_EQ(all.back(), 3);
  EXPECT_TRUE(queue.take_all().empty());
}

// -----------------------------------------------------------------------------
// 7. Several producers and consumers: every value delivered exactly once.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 3;
  constexpr int kConsumers = 3;
  constexpr int kPerProducer = 2000;
  constexpr int kTotal = kProducers * kPerProducer;

  tradebook::ThreadSafeQueue<int> queue;
  std::atomic<int> taken{0};
  std::vector<std::vector<int>> seen(kConsumers);

  std::vector<std::thread> threads;
  for (int p = 0; p < kProducers; ++p) {
    threads.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }
  for (int c = 0; c < kConsumers; ++c) {
    threads.emplace_back([&, c] {
      while (taken.load() < kTotal) {
        if (auto v = queue.try_pop()) {
          seen[c].push_back(*v);
          taken.fetch_add(1);
        } else {
          std::this_thread::yield();
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  std::vector<int> all;
  for (const auto& v : seen) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    ASSERT_EQ(all[i], i);
  }
}
