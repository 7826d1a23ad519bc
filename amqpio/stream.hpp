#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "endpoint.hpp"
#include "tcp_socket.hpp"

namespace amqpio::io {

// Abstract byte stream the buffered reader and writer sit on: the plain
// socket or its TLS wrapper.
class IStream {
 public:
  virtual ~IStream() = default;

  // Reads at least one byte, 0 on end of stream. Throws TransportError
  // (TIMEOUT when the receive timeout expires, IO_ERROR otherwise).
  virtual size_t read(uint8_t* buf, size_t max_len) = 0;

  // Writes all bytes or throws TransportError.
  virtual void write(const uint8_t* data, size_t len) = 0;

  // Best effort, never throws.
  virtual void close() noexcept = 0;
};

// Plain TCP. Does not own the socket.
class SocketStream final : public IStream {
 public:
  explicit SocketStream(TcpSocket& socket) : socket_(socket) {}

  size_t read(uint8_t* buf, size_t max_len) override;
  void write(const uint8_t* data, size_t len) override;
  void close() noexcept override {}

 private:
  TcpSocket& socket_;
};

class IStreamUpgrader {
 public:
  virtual ~IStreamUpgrader() = default;

  // Secures a connected socket. The returned stream borrows the socket,
  // which must outlive it.
  virtual std::unique_ptr<IStream> upgrade(TcpSocket& socket, const SslOption& ssl,
                                           const std::string& host) = 0;
};

// Maps a socket fault raised during read/write to TransportError.
[[noreturn]] void rethrowAsIoError(const char* operation);

}  // namespace amqpio::io
