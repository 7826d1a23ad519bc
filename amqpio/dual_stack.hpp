#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "address.hpp"
#include "connector.hpp"
#include "tcp_socket.hpp"

namespace amqpio::io {

//
// Connects to a host name over IPv6 when it can and IPv4 otherwise:
//
//   resolve(host)
//     no IPv6 candidate  -> IPv6 requested ? fail : try IPv4
//     IPv6 candidate     -> IPv6 usable and not IPv4-only ? try IPv6
//   try IPv6 failed      -> discard, try IPv4
//   try IPv4             -> needs an IPv4 candidate, failure is final
//
// Attempts run one after the other under the same per-attempt deadline;
// there is no race between families.
//
class DualStackConnector {
 public:
  DualStackConnector(IResolver& resolver, IConnector& connector,
                     bool ipv6_supported = platformSupportsIPv6())
      : resolver_(resolver), connector_(connector), ipv6_supported_(ipv6_supported) {}

  // Throws TransportError(CONNECT_FAILURE); resolution problems are carried
  // as a RESOLUTION_FAILURE cause.
  std::unique_ptr<TcpSocket> connect(const std::string& host, uint16_t port,
                                     AddressFamily requested,
                                     std::chrono::milliseconds timeout);

 private:
  [[nodiscard]] bool shouldTryIPv6(AddressFamily requested) const;

  IResolver& resolver_;
  IConnector& connector_;
  bool ipv6_supported_;
};

}  // namespace amqpio::io
