#include "address.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>

#include "error.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

const char* toString(const AddressFamily family) {
  switch (family) {
    case AddressFamily::IPv4:
      return "IPv4";
    case AddressFamily::IPv6:
      return "IPv6";
    case AddressFamily::Unspecified:
      break;
  }
  return "Unspecified";
}

int toNative(const AddressFamily family) {
  switch (family) {
    case AddressFamily::IPv4:
      return AF_INET;
    case AddressFamily::IPv6:
      return AF_INET6;
    case AddressFamily::Unspecified:
      break;
  }
  return AF_UNSPEC;
}

IpAddress IpAddress::v4(const in_addr& addr) {
  IpAddress ip;
  ip.family_ = AddressFamily::IPv4;
  std::memcpy(ip.bytes_.data(), &addr, sizeof(addr));
  return ip;
}

IpAddress IpAddress::v6(const in6_addr& addr, const uint32_t scope_id) {
  IpAddress ip;
  ip.family_ = AddressFamily::IPv6;
  std::memcpy(ip.bytes_.data(), &addr, sizeof(addr));
  ip.scope_id_ = scope_id;
  return ip;
}

std::optional<IpAddress> IpAddress::parse(const std::string& text) {
  in_addr v4addr{};
  if (::inet_pton(AF_INET, text.c_str(), &v4addr) == 1) {
    return v4(v4addr);
  }
  in6_addr v6addr{};
  if (::inet_pton(AF_INET6, text.c_str(), &v6addr) == 1) {
    return v6(v6addr);
  }
  return std::nullopt;
}

std::string IpAddress::toString() const {
  char buf[INET6_ADDRSTRLEN] = {};
  switch (family_) {
    case AddressFamily::IPv4:
      ::inet_ntop(AF_INET, bytes_.data(), buf, sizeof(buf));
      return buf;
    case AddressFamily::IPv6:
      ::inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf));
      if (scope_id_ != 0) {
        return fmt::format("{}%{}", buf, scope_id_);
      }
      return buf;
    case AddressFamily::Unspecified:
      break;
  }
  return "<unspecified>";
}

SocketAddress SocketAddress::fromNative(const sockaddr* sa, const socklen_t len) {
  if (sa->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
    return {IpAddress::v4(in->sin_addr), ntohs(in->sin_port)};
  }
  if (sa->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
    return {IpAddress::v6(in6->sin6_addr, in6->sin6_scope_id), ntohs(in6->sin6_port)};
  }
  throw std::invalid_argument(
      fmt::format("unsupported socket address family {}", sa->sa_family));
}

socklen_t SocketAddress::toNative(sockaddr_storage& storage) const {
  std::memset(&storage, 0, sizeof(storage));
  switch (address_.family_) {
    case AddressFamily::IPv4: {
      auto* in = reinterpret_cast<sockaddr_in*>(&storage);
      in->sin_family = AF_INET;
      in->sin_port = htons(port_);
      std::memcpy(&in->sin_addr, address_.bytes_.data(), sizeof(in->sin_addr));
      return sizeof(sockaddr_in);
    }
    case AddressFamily::IPv6: {
      auto* in6 = reinterpret_cast<sockaddr_in6*>(&storage);
      in6->sin6_family = AF_INET6;
      in6->sin6_port = htons(port_);
      in6->sin6_scope_id = address_.scope_id_;
      std::memcpy(&in6->sin6_addr, address_.bytes_.data(), sizeof(in6->sin6_addr));
      return sizeof(sockaddr_in6);
    }
    case AddressFamily::Unspecified:
      break;
  }
  throw std::invalid_argument("cannot convert an unspecified address");
}

std::string SocketAddress::toString() const {
  if (address_.isV6()) {
    return fmt::format("[{}]:{}", address_.toString(), port_);
  }
  return fmt::format("{}:{}", address_.toString(), port_);
}

std::ostream& operator<<(std::ostream& os, const IpAddress& address) {
  return os << address.toString();
}

std::ostream& operator<<(std::ostream& os, const SocketAddress& address) {
  return os << address.toString();
}

std::vector<IpAddress> SystemResolver::resolve(const std::string& host) {
  if (auto numeric = IpAddress::parse(host)) {
    return {*numeric};
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* raw = nullptr;
  if (const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw); rc != 0) {
    throw TransportError(
        TransportError::Code::RESOLUTION_FAILURE,
        fmt::format("Failed to resolve {}: {}", host, ::gai_strerror(rc)));
  }
  const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> result(raw, &::freeaddrinfo);

  std::vector<IpAddress> addresses;
  for (const addrinfo* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
    if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) {
      continue;
    }
    auto address = SocketAddress::fromNative(ai->ai_addr, ai->ai_addrlen).address();
    // getaddrinfo repeats an address once per socket type it supports
    if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
      addresses.push_back(address);
    }
  }

  LOG(DEBUG) << "Resolved " << host << " to " << addresses.size() << " address(es)";
  return addresses;
}

std::optional<IpAddress> selectMatching(const std::vector<IpAddress>& candidates,
                                        const AddressFamily family) {
  for (const auto& candidate : candidates) {
    if (candidate.family() == family) {
      return candidate;
    }
  }
  return std::nullopt;
}

bool platformSupportsIPv6() {
  static const bool supported = [] {
    const int fd = ::socket(AF_INET6, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      LOG(DEBUG) << "IPv6 sockets unavailable: " << std::strerror(errno);
      return false;
    }
    ::close(fd);
    return true;
  }();
  return supported;
}

}  // namespace amqpio::io
