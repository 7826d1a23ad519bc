#include "buffered_stream.hpp"

#include <algorithm>
#include <cstring>

namespace amqpio::io {

BufferedReader::BufferedReader(IStream& stream, const size_t capacity)
    : stream_(stream), buffer_(capacity > 0 ? capacity : kDefaultCapacity) {}

bool BufferedReader::fill() {
  begin_ = 0;
  end_ = stream_.read(buffer_.data(), buffer_.size());
  return end_ > 0;
}

size_t BufferedReader::read(uint8_t* buf, const size_t max_len) {
  if (max_len == 0) {
    return 0;
  }
  if (begin_ == end_) {
    // Large reads bypass the buffer
    if (max_len >= buffer_.size()) {
      return stream_.read(buf, max_len);
    }
    if (!fill()) {
      return 0;
    }
  }
  const size_t n = std::min(max_len, end_ - begin_);
  std::memcpy(buf, buffer_.data() + begin_, n);
  begin_ += n;
  return n;
}

size_t BufferedReader::readFully(uint8_t* buf, const size_t len) {
  size_t total = 0;
  while (total < len) {
    const size_t n = read(buf + total, len - total);
    if (n == 0) {
      break;
    }
    total += n;
  }
  return total;
}

int BufferedReader::readByte() {
  if (begin_ == end_ && !fill()) {
    return -1;
  }
  return buffer_[begin_++];
}

BufferedWriter::BufferedWriter(IStream& stream, const size_t capacity)
    : stream_(stream), buffer_(capacity > 0 ? capacity : kDefaultCapacity) {}

void BufferedWriter::write(const uint8_t* data, const size_t len) {
  if (len > buffer_.size() - used_) {
    flush();
  }
  if (len >= buffer_.size()) {
    stream_.write(data, len);
    return;
  }
  std::memcpy(buffer_.data() + used_, data, len);
  used_ += len;
}

void BufferedWriter::flush() {
  if (used_ == 0) {
    return;
  }
  // Buffered bytes are discarded even if the write throws
  const size_t pending = used_;
  used_ = 0;
  stream_.write(buffer_.data(), pending);
}

}  // namespace amqpio::io
