#include "dual_stack.hpp"

#include <vector>

#include <fmt/format.h>

#include "error.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

using enum TransportError::Code;

namespace {

[[noreturn]] void failResolution(const std::string& message) {
  throwConnectFailure(
      std::make_exception_ptr(TransportError(RESOLUTION_FAILURE, message)));
}

}  // namespace

bool DualStackConnector::shouldTryIPv6(const AddressFamily requested) const {
  return ipv6_supported_ && requested != AddressFamily::IPv4;
}

std::unique_ptr<TcpSocket> DualStackConnector::connect(
    const std::string& host, const uint16_t port, const AddressFamily requested,
    const std::chrono::milliseconds timeout) {
  std::vector<IpAddress> candidates;
  try {
    candidates = resolver_.resolve(host);
  } catch (const TransportError& e) {
    LOG(DEBUG) << "Resolving " << host << " failed: " << e.what();
    throwConnectFailure(std::current_exception());
  }

  std::unique_ptr<TcpSocket> socket;

  const auto ipv6 = selectMatching(candidates, AddressFamily::IPv6);
  if (!ipv6) {
    if (requested == AddressFamily::IPv6) {
      failResolution(fmt::format("No IPv6 address could be resolved for {}", host));
    }
  } else if (shouldTryIPv6(requested)) {
    try {
      socket = connector_.connect(SocketAddress(*ipv6, port), timeout);
    } catch (const TransportError& e) {
      if (e.code() != CONNECT_FAILURE) {
        throw;
      }
      LOG(DEBUG) << "IPv6 connection to " << host << " failed, falling back to IPv4: "
                 << e.what();
    }
  }

  if (!socket) {
    const auto ipv4 = selectMatching(candidates, AddressFamily::IPv4);
    if (!ipv4) {
      failResolution(fmt::format("No ip address could be resolved for {}", host));
    }
    socket = connector_.connect(SocketAddress(*ipv4, port), timeout);
  }

  return socket;
}

}  // namespace amqpio::io
