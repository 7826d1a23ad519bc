#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "stream.hpp"

namespace amqpio::io {

// Read side buffering over an IStream. Not thread safe: one reader.
class BufferedReader {
 public:
  static constexpr size_t kDefaultCapacity = 8192;

  explicit BufferedReader(IStream& stream, size_t capacity = kDefaultCapacity);

  BufferedReader(const BufferedReader&) = delete;
  BufferedReader& operator=(const BufferedReader&) = delete;

  // Up to max_len bytes, at least one unless the stream ended (0).
  size_t read(uint8_t* buf, size_t max_len);

  // Keeps reading until len bytes arrived or the stream ended; returns the
  // count actually read.
  size_t readFully(uint8_t* buf, size_t len);

  // Next byte, or -1 at end of stream.
  int readByte();

  [[nodiscard]] size_t capacity() const { return buffer_.size(); }
  [[nodiscard]] size_t buffered() const { return end_ - begin_; }

 private:
  bool fill();

  IStream& stream_;
  std::vector<uint8_t> buffer_;
  size_t begin_ = 0;
  size_t end_ = 0;
};

// Write side buffering over an IStream. Bytes reach the stream when the
// buffer fills up or on flush(). Not thread safe: callers serialize.
class BufferedWriter {
 public:
  static constexpr size_t kDefaultCapacity = 8192;

  explicit BufferedWriter(IStream& stream, size_t capacity = kDefaultCapacity);

  BufferedWriter(const BufferedWriter&) = delete;
  BufferedWriter& operator=(const BufferedWriter&) = delete;

  void write(const uint8_t* data, size_t len);
  void flush();

  [[nodiscard]] size_t capacity() const { return buffer_.size(); }
  [[nodiscard]] size_t buffered() const { return used_; }

 private:
  IStream& stream_;
  std::vector<uint8_t> buffer_;
  size_t used_ = 0;
};

}  // namespace amqpio::io
