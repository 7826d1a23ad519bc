#include "queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <thread>
#include <vector>

using namespace amqpio::wheels::concurrent;
using namespace std::chrono_literals;

TEST(QueueTest, BasicPutTake) {
  UnboundedBlockingQueue<int> queue;

  EXPECT_FALSE(queue.put(42).has_value());
  auto result = queue.tryTake();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value(), 42);
}

TEST(QueueTest, EmptyQueue) {
  UnboundedBlockingQueue<int> queue;

  EXPECT_FALSE(queue.tryTake().has_value());
}

TEST(QueueTest, PreservesOrder) {
  UnboundedBlockingQueue<int> queue;

  for (int i = 0; i < 1000; ++i) {
    queue.put(i);
  }

  for (int i = 0; i < 1000; ++i) {
    auto result = queue.tryTake();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), i);
  }

  EXPECT_FALSE(queue.tryTake().has_value());
}

TEST(QueueTest, MoveOnlyType) {
  UnboundedBlockingQueue<std::unique_ptr<int>> queue;

  queue.put(std::make_unique<int>(42));

  auto result = queue.tryTake();

  ASSERT_TRUE(result.has_value());
  ASSERT_NE(result.value(), nullptr);
  EXPECT_EQ(*result.value(), 42);
}

TEST(QueueTest, PutOnClosedQueueHandsItemBack) {
  UnboundedBlockingQueue<std::unique_ptr<int>> queue;
  queue.close();

  auto rejected = queue.put(std::make_unique<int>(7));

  ASSERT_TRUE(rejected.has_value());
  ASSERT_NE(rejected.value(), nullptr);
  EXPECT_EQ(*rejected.value(), 7);
  EXPECT_EQ(queue.size(), 0u);
}

TEST(QueueTest, CloseKeepsQueuedItemsTakeable) {
  UnboundedBlockingQueue<int> queue;
  queue.put(1);
  queue.put(2);
  queue.close();

  EXPECT_TRUE(queue.isClosed());
  EXPECT_TRUE(queue.waitNonEmpty());
  EXPECT_EQ(queue.tryTake().value(), 1);
  EXPECT_TRUE(queue.waitNonEmpty());
  EXPECT_EQ(queue.tryTake().value(), 2);
  EXPECT_FALSE(queue.waitNonEmpty());
}

TEST(QueueTest, CloseWakesBlockedConsumer) {
  UnboundedBlockingQueue<int> queue;
  std::atomic<bool> woke{false};

  std::thread consumer([&] {
    EXPECT_FALSE(queue.waitNonEmpty());
    woke.store(true);
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(woke.load());

  queue.close();
  consumer.join();
  EXPECT_TRUE(woke.load());
}

TEST(QueueTest, MultipleProducersSingleConsumer) {
  UnboundedBlockingQueue<int> queue;

  constexpr int kNumProducers = 4;
  constexpr int kItemsPerProducer = 1000;

  std::vector<std::thread> producers;
  producers.reserve(kNumProducers);

  std::latch start_latch(kNumProducers + 1);

  for (int p = 0; p < kNumProducers; ++p) {
    producers.emplace_back([&queue, &start_latch, p]() {
      start_latch.count_down();
      start_latch.wait();

      for (int i = 0; i < kItemsPerProducer; ++i) {
        queue.put(p * kItemsPerProducer + i);
      }
    });
  }

  std::vector<int> consumed;
  consumed.reserve(kNumProducers * kItemsPerProducer);

  std::thread consumer([&] {
    start_latch.count_down();
    start_latch.wait();

    while (queue.waitNonEmpty()) {
      while (auto item = queue.tryTake()) {
        consumed.push_back(item.value());
      }
    }
  });

  for (auto& producer : producers) {
    producer.join();
  }
  queue.close();
  consumer.join();

  ASSERT_EQ(consumed.size(), kNumProducers * kItemsPerProducer);

  // Per-producer order survives interleaving
  std::vector<int> last_seen(kNumProducers, -1);
  for (const int v : consumed) {
    const int producer = v / kItemsPerProducer;
    EXPECT_GT(v, last_seen[producer]);
    last_seen[producer] = v;
  }

  std::sort(consumed.begin(), consumed.end());
  for (size_t i = 0; i < consumed.size(); ++i) {
    EXPECT_EQ(consumed[i], static_cast<int>(i));
  }
}
