#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "address.hpp"

namespace amqpio::io {

// Blocking TCP client socket. Socket-level faults are reported as
// std::system_error carrying the errno value.
//
// close() may race with the timeout setters and with a reader blocked in
// recv(): the descriptor is swapped out atomically and shut down before it
// is released, operations on a closed socket fail with EBADF.
class TcpSocket {
 public:
  explicit TcpSocket(int fd, AddressFamily family);
  ~TcpSocket();

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  static std::unique_ptr<TcpSocket> open(AddressFamily family);

  // Connects within the timeout, ETIMEDOUT when it expires. The socket is
  // left in blocking mode.
  void connect(const SocketAddress& remote, std::chrono::milliseconds timeout);

  // Returns the number of bytes sent. EAGAIN means the send timeout expired.
  size_t send(const uint8_t* data, size_t len);

  // Returns 0 on orderly shutdown. EAGAIN means the receive timeout expired.
  size_t recv(uint8_t* buf, size_t max_len);

  // Blocks until readable or the receive timeout expires; false on timeout.
  bool waitReadable();

  void setReceiveTimeout(std::chrono::milliseconds timeout);
  void setSendTimeout(std::chrono::milliseconds timeout);
  [[nodiscard]] std::chrono::milliseconds receiveTimeout() const;

  void setNoDelay(bool enabled);
  void setReceiveBufferSize(int bytes);
  void setSendBufferSize(int bytes);
  [[nodiscard]] int receiveBufferSize() const;
  [[nodiscard]] int sendBufferSize() const;

  [[nodiscard]] SocketAddress localAddress() const;
  [[nodiscard]] SocketAddress remoteAddress() const;

  [[nodiscard]] AddressFamily family() const { return family_; }
  [[nodiscard]] bool isOpen() const { return fd_.load() >= 0; }
  [[nodiscard]] int nativeHandle() const { return fd_.load(); }

  void close();

 private:
  int checkedFd() const;
  void setTimeout(int option, std::chrono::milliseconds timeout);
  int getIntOption(int level, int option) const;
  void setIntOption(int level, int option, int value);

  std::atomic<int> fd_;
  AddressFamily family_;
};

// Loopback listener for the client side to connect to.
class TcpServerSocket {
 public:
  ~TcpServerSocket();

  TcpServerSocket(const TcpServerSocket&) = delete;
  TcpServerSocket& operator=(const TcpServerSocket&) = delete;

  static std::unique_ptr<TcpServerSocket> listen(const std::string& host,
                                                 uint16_t port);

  std::unique_ptr<TcpSocket> accept();
  void close();
  [[nodiscard]] uint16_t port() const;

 private:
  TcpServerSocket(int fd, AddressFamily family);

  int fd_;
  AddressFamily family_;
  std::atomic<bool> closed_{false};
};

}  // namespace amqpio::io
