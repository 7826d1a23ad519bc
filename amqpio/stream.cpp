#include "stream.hpp"

#include <system_error>

#include <fmt/format.h>

#include "error.hpp"

namespace amqpio::io {

using enum TransportError::Code;

void rethrowAsIoError(const char* operation) {
  try {
    throw;
  } catch (const std::system_error& e) {
    const auto code = e.code();
    const bool timed_out = code == std::errc::resource_unavailable_try_again ||
                           code == std::errc::operation_would_block ||
                           code == std::errc::timed_out;
    throw TransportError(timed_out ? TIMEOUT : IO_ERROR,
                         fmt::format("Socket {} failed", operation),
                         std::current_exception());
  }
}

size_t SocketStream::read(uint8_t* buf, const size_t max_len) {
  try {
    return socket_.recv(buf, max_len);
  } catch (const std::system_error&) {
    rethrowAsIoError("read");
  }
}

void SocketStream::write(const uint8_t* data, size_t len) {
  try {
    while (len > 0) {
      const size_t n = socket_.send(data, len);
      data += n;
      len -= n;
    }
  } catch (const std::system_error&) {
    rethrowAsIoError("write");
  }
}

}  // namespace amqpio::io
