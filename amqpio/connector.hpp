#pragma once

#include <chrono>
#include <memory>

#include "address.hpp"
#include "tcp_socket.hpp"

namespace amqpio::io {

struct ConnectorOptions {
  bool no_delay = true;
  int receive_buffer_size = 65536;
  int send_buffer_size = 65536;
};

class IConnector {
 public:
  virtual ~IConnector() = default;

  // A connected socket, or TransportError(CONNECT_FAILURE) whose cause is
  // the underlying fault.
  virtual std::unique_ptr<TcpSocket> connect(const SocketAddress& remote,
                                             std::chrono::milliseconds timeout) = 0;
};

class TcpConnector final : public IConnector {
 public:
  explicit TcpConnector(ConnectorOptions options = {}) : options_(options) {}

  std::unique_ptr<TcpSocket> connect(const SocketAddress& remote,
                                     std::chrono::milliseconds timeout) override;

 private:
  ConnectorOptions options_;
};

// Wraps the exception in flight into TransportError(CONNECT_FAILURE).
[[noreturn]] void throwConnectFailure(std::exception_ptr cause);

}  // namespace amqpio::io
