#include "buffer_pool.hpp"

#include <new>
#include <stdexcept>

#include <fmt/format.h>

#include "wheels/logging.hpp"

namespace amqpio::io {

void PooledBuffer::resize(const size_t size) {
  if (size > storage_.size()) {
    throw std::length_error(
        fmt::format("Cannot resize a {} byte lease to {}", storage_.size(), size));
  }
  size_ = size;
}

void PooledBuffer::release() noexcept {
  if (pool_ && !storage_.empty()) {
    pool_->giveBack(std::move(storage_));
  }
  storage_ = Buffer{};
  size_ = 0;
  pool_.reset();
}

std::shared_ptr<BufferPool> BufferPool::create() {
  return std::shared_ptr<BufferPool>(new BufferPool());
}

std::shared_ptr<BufferPool> BufferPool::shared() {
  static const std::shared_ptr<BufferPool> pool = create();
  return pool;
}

size_t BufferPool::bucketFor(const size_t size) {
  size_t bucket = 0;
  while ((kMinBufferSize << bucket) < size) {
    ++bucket;
  }
  return bucket;
}

PooledBuffer BufferPool::rent(const size_t size) {
  if (size > kMaxPooledSize) {
    return {Buffer(size), size, shared_from_this()};
  }

  const size_t bucket = bucketFor(size);
  Buffer storage;
  {
    auto buckets = buckets_.wlock();
    auto& free_list = (*buckets)[bucket];
    if (!free_list.empty()) {
      storage = std::move(free_list.back());
      free_list.pop_back();
    }
  }
  if (storage.empty()) {
    storage.resize(kMinBufferSize << bucket);
  }
  return {std::move(storage), size, shared_from_this()};
}

void BufferPool::giveBack(Buffer&& storage) noexcept {
  const size_t capacity = storage.size();
  if (capacity < kMinBufferSize || capacity > kMaxPooledSize) {
    return;
  }
  const size_t bucket = bucketFor(capacity);
  if ((kMinBufferSize << bucket) != capacity) {
    // Not one of ours
    return;
  }

  try {
    auto buckets = buckets_.wlock();
    auto& free_list = (*buckets)[bucket];
    if (free_list.size() < kMaxBuffersPerBucket) {
      free_list.push_back(std::move(storage));
    }
  } catch (const std::bad_alloc&) {
    LOG(WARNING) << "Dropping a " << capacity << " byte buffer: pool bookkeeping out of memory";
  }
}

size_t BufferPool::pooledCount() const {
  auto buckets = buckets_.rlock();
  size_t count = 0;
  for (const auto& free_list : *buckets) {
    count += free_list.size();
  }
  return count;
}

}  // namespace amqpio::io
