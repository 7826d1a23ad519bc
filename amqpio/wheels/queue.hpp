#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace amqpio::wheels::concurrent {
// Unbounded blocking multi-producers/single-consumer queue.
//
// Once closed, put() rejects new items but everything already queued stays
// takeable: a consumer drains with waitNonEmpty()/tryTake() and stops when
// waitNonEmpty() returns false.
template <typename T>
class UnboundedBlockingQueue {
 public:
  UnboundedBlockingQueue() = default;

  // Non-copyable
  UnboundedBlockingQueue(const UnboundedBlockingQueue&) = delete;

  UnboundedBlockingQueue& operator=(const UnboundedBlockingQueue&) = delete;

  // Non-movable
  UnboundedBlockingQueue(UnboundedBlockingQueue&&) = delete;

  ~UnboundedBlockingQueue() = default;

  // On a closed queue the item is handed back untouched.
  std::optional<T> put(T v) {
    {
      std::unique_lock lock(mutex_);
      if (closed_) {
        return std::optional<T>{std::move(v)};
      }
      q_.emplace_back(std::move(v));
    }
    cv_not_empty_.notify_one();
    return std::nullopt;
  }

  std::optional<T> tryTake() {
    std::unique_lock lock(mutex_);
    if (q_.empty()) {
      return std::nullopt;
    }
    auto v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  // Blocks until an item is available (true) or the queue is closed and
  // drained (false).
  bool waitNonEmpty() {
    std::unique_lock lock(mutex_);
    cv_not_empty_.wait(lock, [this] { return !q_.empty() || closed_; });
    return !q_.empty();
  }

  void close() {
    {
      std::unique_lock lock(mutex_);
      closed_ = true;
    }
    cv_not_empty_.notify_all();
  }

  [[nodiscard]] bool isClosed() const {
    std::unique_lock lock(mutex_);
    return closed_;
  }

  [[nodiscard]] size_t size() const {
    std::unique_lock lock(mutex_);
    return q_.size();
  }

 private:
  std::deque<T> q_;
  bool closed_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_not_empty_;
};
}  // namespace amqpio::wheels::concurrent
