#include "buffer_pool.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace amqpio::io;

TEST(BufferPoolTest, RentRoundsUpToBucket) {
  auto pool = BufferPool::create();

  auto buffer = pool->rent(300);

  EXPECT_EQ(buffer.size(), 300);
  EXPECT_EQ(buffer.capacity(), 512);
}

TEST(BufferPoolTest, SmallRentGetsMinimumBucket) {
  auto pool = BufferPool::create();

  EXPECT_EQ(pool->rent(0).capacity(), BufferPool::kMinBufferSize);
  EXPECT_EQ(pool->rent(1).capacity(), BufferPool::kMinBufferSize);
}

TEST(BufferPoolTest, ReleasedStorageIsReused) {
  auto pool = BufferPool::create();
  const uint8_t* first;
  {
    auto buffer = pool->rent(1000);
    first = buffer.data();
  }
  EXPECT_EQ(pool->pooledCount(), 1);

  auto again = pool->rent(900);

  EXPECT_EQ(again.data(), first);
  EXPECT_EQ(pool->pooledCount(), 0);
}

TEST(BufferPoolTest, OversizedBuffersAreNotPooled) {
  auto pool = BufferPool::create();
  {
    auto buffer = pool->rent(BufferPool::kMaxPooledSize + 1);
    EXPECT_EQ(buffer.capacity(), BufferPool::kMaxPooledSize + 1);
  }

  EXPECT_EQ(pool->pooledCount(), 0);
}

TEST(BufferPoolTest, BucketsAreCapped) {
  auto pool = BufferPool::create();
  {
    std::vector<PooledBuffer> leases;
    for (size_t i = 0; i < BufferPool::kMaxBuffersPerBucket + 10; ++i) {
      leases.push_back(pool->rent(64));
    }
  }

  EXPECT_EQ(pool->pooledCount(), BufferPool::kMaxBuffersPerBucket);
}

TEST(BufferPoolTest, ForeignStorageIsDropped) {
  auto pool = BufferPool::create();

  pool->giveBack(Buffer(1000));
  pool->giveBack(Buffer(16));

  EXPECT_EQ(pool->pooledCount(), 0);
}

TEST(PooledBufferTest, ResizeWithinCapacity) {
  auto pool = BufferPool::create();
  auto buffer = pool->rent(10);

  buffer.resize(200);
  EXPECT_EQ(buffer.size(), 200);

  EXPECT_THROW(buffer.resize(buffer.capacity() + 1), std::length_error);
}

TEST(PooledBufferTest, MoveTransfersTheLease) {
  auto pool = BufferPool::create();
  auto original = pool->rent(10);
  original[0] = 7;

  PooledBuffer moved = std::move(original);

  EXPECT_EQ(moved.size(), 10);
  EXPECT_EQ(moved[0], 7);
  EXPECT_EQ(original.size(), 0);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(pool->pooledCount(), 0);

  moved.release();
  original.release();  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(pool->pooledCount(), 1);
}

TEST(PooledBufferTest, ReleaseIsIdempotent) {
  auto pool = BufferPool::create();
  auto buffer = pool->rent(10);

  buffer.release();
  buffer.release();

  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(pool->pooledCount(), 1);
}

TEST(PooledBufferTest, OutlivesItsPoolHandle) {
  PooledBuffer buffer;
  {
    auto pool = BufferPool::create();
    buffer = pool->rent(10);
  }

  // The lease keeps the pool alive until it is released
  buffer.release();
  EXPECT_TRUE(buffer.empty());
}

TEST(BufferPoolTest, ConcurrentRentAndRelease) {
  auto pool = BufferPool::create();
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&pool] {
      for (int i = 0; i < 1000; ++i) {
        auto buffer = pool->rent(static_cast<size_t>(i % 4096));
        buffer[0] = 1;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_LE(pool->pooledCount(), 8 * 5);
}

TEST(BufferPoolTest, SharedPoolIsProcessWide) {
  EXPECT_EQ(BufferPool::shared(), BufferPool::shared());
}
