#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include <folly/Synchronized.h>

namespace amqpio::io {

using Buffer = std::vector<uint8_t>;

class BufferPool;

// Move-only lease on a pooled buffer. size() is the meaningful prefix of the
// underlying storage, which may be larger.
//
// Whoever holds the lease owns the bytes; handing it to the outbound queue
// transfers ownership and the buffer goes back to the pool once written.
class PooledBuffer {
 public:
  PooledBuffer() = default;
  PooledBuffer(Buffer storage, size_t size, std::shared_ptr<BufferPool> pool)
      : storage_(std::move(storage)), size_(size), pool_(std::move(pool)) {}

  ~PooledBuffer() { release(); }

  PooledBuffer(const PooledBuffer&) = delete;
  PooledBuffer& operator=(const PooledBuffer&) = delete;

  PooledBuffer(PooledBuffer&& other) noexcept
      : storage_(std::move(other.storage_)),
        size_(std::exchange(other.size_, 0)),
        pool_(std::move(other.pool_)) {}

  PooledBuffer& operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
      release();
      storage_ = std::move(other.storage_);
      size_ = std::exchange(other.size_, 0);
      pool_ = std::move(other.pool_);
    }
    return *this;
  }

  [[nodiscard]] uint8_t* data() { return storage_.data(); }
  [[nodiscard]] const uint8_t* data() const { return storage_.data(); }
  [[nodiscard]] size_t size() const { return size_; }
  [[nodiscard]] size_t capacity() const { return storage_.size(); }
  [[nodiscard]] bool empty() const { return size_ == 0; }

  uint8_t& operator[](size_t i) { return storage_[i]; }
  const uint8_t& operator[](size_t i) const { return storage_[i]; }

  // Shrinks or grows the meaningful prefix within capacity().
  void resize(size_t size);

  // Returns the storage to its pool now; the lease is empty afterwards.
  void release() noexcept;

 private:
  Buffer storage_;
  size_t size_ = 0;
  std::shared_ptr<BufferPool> pool_;
};

// Thread-safe free list of byte buffers bucketed by power-of-two size.
class BufferPool : public std::enable_shared_from_this<BufferPool> {
 public:
  static constexpr size_t kMinBufferSize = 256;
  static constexpr size_t kMaxPooledSize = 1 << 20;
  static constexpr size_t kMaxBuffersPerBucket = 64;

  static std::shared_ptr<BufferPool> create();

  // Process-wide pool.
  static std::shared_ptr<BufferPool> shared();

  // Lease of at least size bytes, with size() == size.
  PooledBuffer rent(size_t size);

  // Storage coming back from a lease. Oversized buffers and overflowing
  // buckets are freed instead.
  void giveBack(Buffer&& storage) noexcept;

  [[nodiscard]] size_t pooledCount() const;

 private:
  BufferPool() = default;

  static constexpr size_t kBuckets = 13;  // 256 B .. 1 MiB

  static size_t bucketFor(size_t size);

  folly::Synchronized<std::vector<std::vector<Buffer>>> buckets_{
      std::vector<std::vector<Buffer>>(kBuckets)};
};

}  // namespace amqpio::io
