#include "tcp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "wheels/logging.hpp"

using namespace std::chrono;

namespace amqpio::io {

namespace {

[[noreturn]] void throwErrno(const int err, const std::string& what) {
  throw std::system_error(err, std::generic_category(), what);
}

void setNonBlocking(const int fd, const bool enabled) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    throwErrno(errno, "Failed to get socket flags");
  }
  const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(fd, F_SETFL, updated) < 0) {
    throwErrno(errno, "Failed to set <O_NONBLOCK>");
  }
}

timeval toTimeval(const milliseconds timeout) {
  timeval tv{};
  if (timeout.count() <= 0) {
    // zero disables the timeout
    return tv;
  }
  const auto secs = duration_cast<seconds>(timeout);
  tv.tv_sec = secs.count();
  tv.tv_usec = duration_cast<microseconds>(timeout - secs).count();
  return tv;
}

}  // namespace

TcpSocket::TcpSocket(const int fd, const AddressFamily family)
    : fd_(fd), family_(family) {}

TcpSocket::~TcpSocket() {
  close();
}

std::unique_ptr<TcpSocket> TcpSocket::open(const AddressFamily family) {
  if (family == AddressFamily::Unspecified) {
    throw std::invalid_argument("A socket needs a concrete address family");
  }
  const int fd = ::socket(toNative(family), SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throwErrno(errno, fmt::format("Failed to create {} socket", toString(family)));
  }
  return std::make_unique<TcpSocket>(fd, family);
}

void TcpSocket::connect(const SocketAddress& remote, const milliseconds timeout) {
  if (remote.family() != family_) {
    throw std::invalid_argument(fmt::format(
        "Cannot connect a {} socket to {}", toString(family_), remote.toString()));
  }

  const int fd = checkedFd();
  sockaddr_storage storage{};
  const socklen_t len = remote.toNative(storage);

  setNonBlocking(fd, true);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&storage), len) < 0) {
    if (errno != EINPROGRESS) {
      throwErrno(errno, fmt::format("Failed to connect to {}", remote.toString()));
    }

    const auto deadline = steady_clock::now() + timeout;
    while (true) {
      const auto remaining =
          duration_cast<milliseconds>(deadline - steady_clock::now());
      if (remaining.count() <= 0) {
        throwErrno(ETIMEDOUT, fmt::format("Connect to {} timed out", remote.toString()));
      }
      pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
      const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (rc < 0) {
        if (errno == EINTR) {
          continue;
        }
        throwErrno(errno, "poll");
      }
      if (rc == 0) {
        throwErrno(ETIMEDOUT, fmt::format("Connect to {} timed out", remote.toString()));
      }
      break;
    }

    if (const int err = getIntOption(SOL_SOCKET, SO_ERROR); err != 0) {
      throwErrno(err, fmt::format("Failed to connect to {}", remote.toString()));
    }
  }
  setNonBlocking(fd, false);
}

size_t TcpSocket::send(const uint8_t* data, const size_t len) {
  const int fd = checkedFd();
  while (true) {
    const ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno != EINTR) {
      throwErrno(errno, "send");
    }
  }
}

size_t TcpSocket::recv(uint8_t* buf, const size_t max_len) {
  const int fd = checkedFd();
  while (true) {
    const ssize_t n = ::recv(fd, buf, max_len, 0);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno != EINTR) {
      throwErrno(errno, "recv");
    }
  }
}

bool TcpSocket::waitReadable() {
  const int fd = checkedFd();
  const auto timeout = receiveTimeout();
  const int timeout_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
  while (true) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc > 0) {
      return true;
    }
    if (rc == 0) {
      return false;
    }
    if (errno != EINTR) {
      throwErrno(errno, "poll");
    }
  }
}

void TcpSocket::setReceiveTimeout(const milliseconds timeout) {
  setTimeout(SO_RCVTIMEO, timeout);
}

void TcpSocket::setSendTimeout(const milliseconds timeout) {
  setTimeout(SO_SNDTIMEO, timeout);
}

milliseconds TcpSocket::receiveTimeout() const {
  timeval tv{};
  socklen_t len = sizeof(tv);
  if (::getsockopt(checkedFd(), SOL_SOCKET, SO_RCVTIMEO, &tv, &len) < 0) {
    throwErrno(errno, "Failed to get <SO_RCVTIMEO>");
  }
  return duration_cast<milliseconds>(seconds(tv.tv_sec) + microseconds(tv.tv_usec));
}

void TcpSocket::setTimeout(const int option, const milliseconds timeout) {
  if (timeout.count() < 0) {
    throw std::invalid_argument("Socket timeout must not be negative");
  }
  const timeval tv = toTimeval(timeout);
  if (::setsockopt(checkedFd(), SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
    throwErrno(errno, option == SO_RCVTIMEO ? "Failed to set <SO_RCVTIMEO>"
                                            : "Failed to set <SO_SNDTIMEO>");
  }
}

void TcpSocket::setNoDelay(const bool enabled) {
  setIntOption(IPPROTO_TCP, TCP_NODELAY, enabled ? 1 : 0);
}

void TcpSocket::setReceiveBufferSize(const int bytes) {
  setIntOption(SOL_SOCKET, SO_RCVBUF, bytes);
}

void TcpSocket::setSendBufferSize(const int bytes) {
  setIntOption(SOL_SOCKET, SO_SNDBUF, bytes);
}

int TcpSocket::receiveBufferSize() const {
  return getIntOption(SOL_SOCKET, SO_RCVBUF);
}

int TcpSocket::sendBufferSize() const {
  return getIntOption(SOL_SOCKET, SO_SNDBUF);
}

SocketAddress TcpSocket::localAddress() const {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getsockname(checkedFd(), reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
    throwErrno(errno, "Failed to get socket name");
  }
  return SocketAddress::fromNative(reinterpret_cast<sockaddr*>(&storage), len);
}

SocketAddress TcpSocket::remoteAddress() const {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getpeername(checkedFd(), reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
    throwErrno(errno, "Failed to get peer name");
  }
  return SocketAddress::fromNative(reinterpret_cast<sockaddr*>(&storage), len);
}

void TcpSocket::close() {
  const int fd = fd_.exchange(-1);
  if (fd < 0) {
    return;
  }
  // Wakes a reader blocked in recv() on this descriptor
  if (::shutdown(fd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
    LOG(DEBUG) << "shutdown(" << fd << ") failed: " << std::strerror(errno);
  }
  if (::close(fd) < 0) {
    LOG(DEBUG) << "close(" << fd << ") failed: " << std::strerror(errno);
  }
}

int TcpSocket::checkedFd() const {
  const int fd = fd_.load();
  if (fd < 0) {
    throwErrno(EBADF, "Socket is closed");
  }
  return fd;
}

int TcpSocket::getIntOption(const int level, const int option) const {
  int value = 0;
  socklen_t len = sizeof(value);
  if (::getsockopt(checkedFd(), level, option, &value, &len) < 0) {
    throwErrno(errno, fmt::format("getsockopt({}, {})", level, option));
  }
  return value;
}

void TcpSocket::setIntOption(const int level, const int option, const int value) {
  if (::setsockopt(checkedFd(), level, option, &value, sizeof(value)) < 0) {
    throwErrno(errno, fmt::format("setsockopt({}, {})", level, option));
  }
}

TcpServerSocket::TcpServerSocket(const int fd, const AddressFamily family)
    : fd_(fd), family_(family) {}

TcpServerSocket::~TcpServerSocket() {
  close();
}

std::unique_ptr<TcpServerSocket> TcpServerSocket::listen(const std::string& host,
                                                         const uint16_t port) {
  const auto ip = IpAddress::parse(host);
  if (!ip) {
    throw std::invalid_argument("Wrong addr: " + host);
  }

  const int fd = ::socket(toNative(ip->family()), SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throwErrno(errno, "Failed to create socket");
  }

  constexpr int kTrue = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kTrue, sizeof(kTrue)) < 0) {
    const int err = errno;
    ::close(fd);
    throwErrno(err, "Failed to set to <SO_REUSEADDR>");
  }

  sockaddr_storage storage{};
  const socklen_t len = SocketAddress(*ip, port).toNative(storage);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&storage), len) < 0) {
    const int err = errno;
    ::close(fd);
    throwErrno(err, "Failed to bind");
  }

  if (::listen(fd, SOMAXCONN) < 0) {
    const int err = errno;
    ::close(fd);
    throwErrno(err, "Failed to listen");
  }

  return std::unique_ptr<TcpServerSocket>(new TcpServerSocket(fd, ip->family()));
}

std::unique_ptr<TcpSocket> TcpServerSocket::accept() {
  if (closed_.load()) {
    throw std::runtime_error("Server socket is closed");
  }

  sockaddr_storage client_addr{};
  socklen_t client_len = sizeof(client_addr);

  const int client_fd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                  &client_len, SOCK_CLOEXEC);
  if (client_fd < 0) {
    throwErrno(errno, "Accept failed");
  }

  return std::make_unique<TcpSocket>(client_fd, family_);
}

void TcpServerSocket::close() {
  bool expected = false;
  if (closed_.compare_exchange_strong(expected, true)) {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
      ::close(fd_);
      fd_ = -1;
    }
  }
}

uint16_t TcpServerSocket::port() const {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
    throwErrno(errno, "Failed to get socket name");
  }
  return SocketAddress::fromNative(reinterpret_cast<sockaddr*>(&storage), len).port();
}

}  // namespace amqpio::io
