#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace amqpio::io {

enum class AddressFamily : uint8_t {
  Unspecified,
  IPv4,
  IPv6,
};

const char* toString(AddressFamily family);

int toNative(AddressFamily family);

class IpAddress {
 public:
  IpAddress() = default;

  static IpAddress v4(const in_addr& addr);
  static IpAddress v6(const in6_addr& addr, uint32_t scope_id = 0);

  // Numeric form only ("127.0.0.1", "::1"); nullopt for anything else.
  static std::optional<IpAddress> parse(const std::string& text);

  [[nodiscard]] AddressFamily family() const { return family_; }
  [[nodiscard]] bool isV4() const { return family_ == AddressFamily::IPv4; }
  [[nodiscard]] bool isV6() const { return family_ == AddressFamily::IPv6; }

  [[nodiscard]] std::string toString() const;

  bool operator==(const IpAddress& other) const = default;

 private:
  friend class SocketAddress;

  AddressFamily family_{AddressFamily::Unspecified};
  std::array<uint8_t, 16> bytes_{};
  uint32_t scope_id_{0};
};

// An IP address with a port, convertible to and from sockaddr.
class SocketAddress {
 public:
  SocketAddress() = default;
  SocketAddress(IpAddress address, uint16_t port)
      : address_(address), port_(port) {}

  static SocketAddress fromNative(const sockaddr* sa, socklen_t len);

  [[nodiscard]] const IpAddress& address() const { return address_; }
  [[nodiscard]] uint16_t port() const { return port_; }
  [[nodiscard]] AddressFamily family() const { return address_.family(); }

  // Fills storage and returns the meaningful length.
  socklen_t toNative(sockaddr_storage& storage) const;

  // "127.0.0.1:5672", "[::1]:5672"
  [[nodiscard]] std::string toString() const;

  bool operator==(const SocketAddress& other) const = default;

 private:
  IpAddress address_;
  uint16_t port_{0};
};

std::ostream& operator<<(std::ostream& os, const IpAddress& address);
std::ostream& operator<<(std::ostream& os, const SocketAddress& address);

class IResolver {
 public:
  virtual ~IResolver() = default;

  // Every address the host name resolves to, in resolver order. Throws
  // TransportError(RESOLUTION_FAILURE) when the name cannot be resolved.
  virtual std::vector<IpAddress> resolve(const std::string& host) = 0;
};

// getaddrinfo(3) backed resolver. Numeric hosts resolve to themselves.
class SystemResolver final : public IResolver {
 public:
  std::vector<IpAddress> resolve(const std::string& host) override;
};

// First candidate of the requested family, if any.
std::optional<IpAddress> selectMatching(const std::vector<IpAddress>& candidates,
                                        AddressFamily family);

// Whether an AF_INET6 stream socket can be created on this host.
bool platformSupportsIPv6();

}  // namespace amqpio::io
