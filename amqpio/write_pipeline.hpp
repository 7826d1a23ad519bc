#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <span>
#include <thread>

#include <folly/Synchronized.h>

#include "buffer_pool.hpp"
#include "buffered_stream.hpp"
#include "wheels/queue.hpp"

namespace amqpio::io {

// Receives notifications about outbound traffic. Nothing in the transport
// depends on what the sink does with them.
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  // Called by the writer thread once per buffer written.
  virtual void onBytesSent(size_t bytes) = 0;
};

class NullEventSink final : public IEventSink {
 public:
  void onBytesSent(size_t) override {}

  static NullEventSink& instance() {
    static NullEventSink sink;
    return sink;
  }
};

// Multi-producer outbound path with a single background writer.
//
//   producers --enqueue()--> [ queue ] --writer thread--> BufferedWriter
//                                          | write each buffer
//                                          | give it back to the pool
//                                          | flush once the queue is drained
//
// writeImmediately() bypasses the queue and shares the write lock with the
// writer thread, so its bytes never interleave with a drain.
//
// A write fault stops the writer: the queue is closed, everything still
// queued goes back to the pool and the fault is kept in fault().
class WritePipeline {
 public:
  WritePipeline(BufferedWriter& writer, IEventSink& events);
  ~WritePipeline();

  WritePipeline(const WritePipeline&) = delete;
  WritePipeline& operator=(const WritePipeline&) = delete;

  // Non-blocking. False if the pipeline is closed; the buffer is returned
  // to its pool in that case.
  bool enqueue(PooledBuffer&& buffer);

  // Synchronous write and flush from the calling thread.
  void writeImmediately(std::span<const uint8_t> bytes);

  // Stops accepting buffers, lets the writer drain what is queued and
  // joins it. Idempotent.
  void close();

  [[nodiscard]] std::exception_ptr fault() const;
  [[nodiscard]] bool isClosed() const { return queue_.isClosed(); }
  [[nodiscard]] size_t pending() const { return queue_.size(); }

 private:
  void run();
  void notifySent(size_t bytes);
  void discardQueued();

  BufferedWriter& writer_;
  IEventSink& events_;
  wheels::concurrent::UnboundedBlockingQueue<PooledBuffer> queue_;
  std::mutex write_mutex_;
  std::mutex join_mutex_;
  folly::Synchronized<std::exception_ptr> fault_;
  std::thread writer_thread_;
};

}  // namespace amqpio::io
