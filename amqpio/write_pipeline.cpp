#include "write_pipeline.hpp"

#include "wheels/logging.hpp"

namespace amqpio::io {

WritePipeline::WritePipeline(BufferedWriter& writer, IEventSink& events)
    : writer_(writer), events_(events) {
  writer_thread_ = std::thread([this] { run(); });
}

WritePipeline::~WritePipeline() {
  close();
}

bool WritePipeline::enqueue(PooledBuffer&& buffer) {
  if (auto rejected = queue_.put(std::move(buffer))) {
    LOG(TRACE) << "Dropping " << rejected->size() << " bytes, write pipeline is closed";
    return false;
  }
  return true;
}

void WritePipeline::writeImmediately(const std::span<const uint8_t> bytes) {
  std::lock_guard lock(write_mutex_);
  writer_.write(bytes.data(), bytes.size());
  writer_.flush();
}

void WritePipeline::close() {
  queue_.close();
  std::lock_guard lock(join_mutex_);
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
}

std::exception_ptr WritePipeline::fault() const {
  return *fault_.rlock();
}

void WritePipeline::run() {
  try {
    while (queue_.waitNonEmpty()) {
      std::lock_guard lock(write_mutex_);
      while (auto buffer = queue_.tryTake()) {
        writer_.write(buffer->data(), buffer->size());
        notifySent(buffer->size());
        buffer->release();
      }
      writer_.flush();
    }
    LOG(TRACE) << "Writer thread has been stopped";
  } catch (const std::exception& e) {
    LOG(ERROR) << "Writer thread has been stopped abnormally: " << e.what();
    *fault_.wlock() = std::current_exception();
    queue_.close();
    discardQueued();
  }
}

void WritePipeline::notifySent(const size_t bytes) {
  try {
    events_.onBytesSent(bytes);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Event sink failed: " << e.what();
  }
}

void WritePipeline::discardQueued() {
  size_t dropped = 0;
  while (auto buffer = queue_.tryTake()) {
    ++dropped;
  }
  if (dropped > 0) {
    LOG(DEBUG) << "Returned " << dropped << " unsent buffers to the pool";
  }
}

}  // namespace amqpio::io
