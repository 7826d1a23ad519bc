#pragma once

#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "address.hpp"

namespace amqpio {

struct ProtocolVersion {
  uint8_t major = 0;
  uint8_t minor = 9;
  uint8_t revision = 1;
};

// AMQP 0-9-1
inline constexpr ProtocolVersion kAmqp091{.major = 0, .minor = 9, .revision = 1};

enum class TlsVersion : uint8_t {
  TLS1_2,
  TLS1_3,
};

struct SslOption {
  bool enabled = false;
  // Name checked against the server certificate and sent as SNI; the
  // endpoint host when empty.
  std::string server_name;
  // PEM CA bundle; the system trust store when empty.
  std::string ca_file;
  // Client certificate and key, PEM, both or neither.
  std::string cert_file;
  std::string key_file;
  bool verify_peer = true;
  TlsVersion min_version = TlsVersion::TLS1_2;
};

struct Endpoint {
  static constexpr int kUseDefaultPort = -1;
  static constexpr uint16_t kDefaultPort = 5672;
  static constexpr uint16_t kDefaultTlsPort = 5671;
  static constexpr uint32_t kDefaultMaxMessageSize = 128 * 1024 * 1024;

  std::string host = "localhost";
  int port = kUseDefaultPort;
  io::AddressFamily address_family = io::AddressFamily::Unspecified;
  ProtocolVersion protocol = kAmqp091;
  SslOption ssl{};
  // Largest inbound payload accepted, 0 for no limit.
  uint32_t max_message_size = kDefaultMaxMessageSize;

  // port must already be checked against 0..65535.
  [[nodiscard]] uint16_t effectivePort() const {
    if (port == kUseDefaultPort) {
      return ssl.enabled ? kDefaultTlsPort : kDefaultPort;
    }
    return static_cast<uint16_t>(port);
  }

  [[nodiscard]] std::string toString() const {
    return fmt::format("{}{}:{}", ssl.enabled ? "amqps://" : "amqp://", host, effectivePort());
  }
};

}  // namespace amqpio
