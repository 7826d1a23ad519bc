#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "buffer_pool.hpp"
#include "buffered_stream.hpp"
#include "endpoint.hpp"

namespace amqpio::io {

// Frame wire layout:
//
//   +---------+------------+------+-----------------+------+
//   | channel |    size    | type |     payload     | 0xCE |
//   |  u16 BE |   u32 BE   |  u8  |   size bytes    |  u8  |
//   +---------+------------+------+-----------------+------+
//
inline constexpr size_t kFrameHeaderSize = 7;
inline constexpr size_t kFrameEndSize = 1;
inline constexpr uint8_t kFrameEnd = 0xCE;
inline constexpr size_t kProtocolHeaderSize = 8;

enum class FrameType : uint8_t {
  METHOD = 1,
  HEADER = 2,
  BODY = 3,
  HEARTBEAT = 8,
};

// "AMQP" followed by the version bytes of the requested protocol.
std::array<uint8_t, kProtocolHeaderSize> protocolHeader(const ProtocolVersion& version);

class InboundFrame {
 public:
  InboundFrame(uint8_t type, uint16_t channel, PooledBuffer payload)
      : type_(type), channel_(channel), payload_(std::move(payload)) {}

  InboundFrame(InboundFrame&&) noexcept = default;
  InboundFrame& operator=(InboundFrame&&) noexcept = default;

  [[nodiscard]] uint8_t type() const { return type_; }
  [[nodiscard]] uint16_t channel() const { return channel_; }
  [[nodiscard]] std::span<const uint8_t> payload() const {
    return {payload_.data(), payload_.size()};
  }

  [[nodiscard]] bool isHeartbeat() const {
    return type_ == static_cast<uint8_t>(FrameType::HEARTBEAT);
  }

  // Hands the payload lease to the caller.
  PooledBuffer takePayload() { return std::move(payload_); }

 private:
  uint8_t type_;
  uint16_t channel_;
  PooledBuffer payload_;
};

// Reads one frame. max_payload_size of 0 disables the size check.
//
// Throws TransportError:
//   END_OF_STREAM      the stream ended before the first byte
//   PROTOCOL_MISMATCH  the server answered with its own protocol header
//   CONTENT_TOO_LARGE  declared size over the limit, nothing of the payload
//                      has been consumed
//   MALFORMED_FRAME    truncated frame, bad terminator, garbled header
//   TIMEOUT / IO_ERROR from the stream
InboundFrame readFrame(BufferedReader& reader, uint32_t max_payload_size, BufferPool& pool);

// Header + payload + terminator in one leased buffer.
PooledBuffer serializeFrame(uint8_t type, uint16_t channel,
                            std::span<const uint8_t> payload, BufferPool& pool);

PooledBuffer heartbeatFrame(BufferPool& pool);

}  // namespace amqpio::io
