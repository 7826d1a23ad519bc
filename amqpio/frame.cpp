#include "frame.hpp"

#include <cstring>

#include <fmt/format.h>

#include "error.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

using enum TransportError::Code;

namespace {

constexpr std::array<uint8_t, 4> kAmqpSignature = {'A', 'M', 'Q', 'P'};

uint16_t readU16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t readU32(const uint8_t* p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void writeU16(uint8_t* p, const uint16_t v) {
  p[0] = static_cast<uint8_t>(v >> 8);
  p[1] = static_cast<uint8_t>(v);
}

void writeU32(uint8_t* p, const uint32_t v) {
  p[0] = static_cast<uint8_t>(v >> 24);
  p[1] = static_cast<uint8_t>(v >> 16);
  p[2] = static_cast<uint8_t>(v >> 8);
  p[3] = static_cast<uint8_t>(v);
}

// A frame starting with "AMQP" would declare a payload of at least
// 0x51500000 bytes, so these bytes only ever come from a protocol header.
bool isProtocolHeader(const std::array<uint8_t, kFrameHeaderSize>& header) {
  return std::memcmp(header.data(), kAmqpSignature.data(), kAmqpSignature.size()) == 0;
}

// A server that does not speak the requested protocol answers the header
// with its own and closes the connection.
[[noreturn]] void rejectProtocolHeader(BufferedReader& reader,
                                       const std::array<uint8_t, kFrameHeaderSize>& header) {
  const int last = reader.readByte();
  if (last < 0) {
    throw TransportError(MALFORMED_FRAME, "Invalid AMQP protocol header from server");
  }
  throw TransportError(
      PROTOCOL_MISMATCH,
      fmt::format("Server does not support the requested protocol, it offers {}-{} "
                  "(version {}.{})",
                  header[4], header[5], header[6], last));
}

}  // namespace

std::array<uint8_t, kProtocolHeaderSize> protocolHeader(const ProtocolVersion& version) {
  std::array<uint8_t, kProtocolHeaderSize> bytes{'A', 'M', 'Q', 'P'};
  if (version.revision != 0) {
    bytes[4] = 0;
    bytes[5] = version.major;
    bytes[6] = version.minor;
    bytes[7] = version.revision;
  } else {
    bytes[4] = 1;
    bytes[5] = 1;
    bytes[6] = version.major;
    bytes[7] = version.minor;
  }
  return bytes;
}

InboundFrame readFrame(BufferedReader& reader, const uint32_t max_payload_size,
                       BufferPool& pool) {
  std::array<uint8_t, kFrameHeaderSize> header{};

  const int first = reader.readByte();
  if (first < 0) {
    throw TransportError(END_OF_STREAM,
                         "Reached the end of the stream. Possible authentication failure.");
  }
  header[0] = static_cast<uint8_t>(first);
  if (reader.readFully(header.data() + 1, kFrameHeaderSize - 1) != kFrameHeaderSize - 1) {
    throw TransportError(MALFORMED_FRAME, "Truncated frame header");
  }

  if (isProtocolHeader(header)) {
    rejectProtocolHeader(reader, header);
  }

  const uint16_t channel = readU16(header.data());
  const uint32_t payload_size = readU32(header.data() + 2);
  const uint8_t type = header[6];

  if (max_payload_size > 0 && payload_size > max_payload_size) {
    throw TransportError(CONTENT_TOO_LARGE,
                         fmt::format("Frame payload size '{}' exceeds maximum of '{}' bytes",
                                     payload_size, max_payload_size));
  }

  auto payload = pool.rent(payload_size);
  if (reader.readFully(payload.data(), payload_size) != payload_size) {
    throw TransportError(MALFORMED_FRAME,
                         fmt::format("Truncated frame payload, expected {} bytes", payload_size));
  }

  const int frame_end = reader.readByte();
  if (frame_end < 0) {
    throw TransportError(MALFORMED_FRAME, "Truncated frame, missing frame end marker");
  }
  if (frame_end != kFrameEnd) {
    throw TransportError(MALFORMED_FRAME, fmt::format("Bad frame end marker: {}", frame_end));
  }

  LOG(TRACE) << "Read frame type=" << static_cast<int>(type) << " channel=" << channel
             << " size=" << payload_size;
  return {type, channel, std::move(payload)};
}

PooledBuffer serializeFrame(const uint8_t type, const uint16_t channel,
                            const std::span<const uint8_t> payload, BufferPool& pool) {
  const size_t total = kFrameHeaderSize + payload.size() + kFrameEndSize;
  auto frame = pool.rent(total);
  uint8_t* p = frame.data();

  writeU16(p, channel);
  writeU32(p + 2, static_cast<uint32_t>(payload.size()));
  p[6] = type;
  if (!payload.empty()) {
    std::memcpy(p + kFrameHeaderSize, payload.data(), payload.size());
  }
  p[total - 1] = kFrameEnd;
  return frame;
}

PooledBuffer heartbeatFrame(BufferPool& pool) {
  return serializeFrame(static_cast<uint8_t>(FrameType::HEARTBEAT), 0, {}, pool);
}

}  // namespace amqpio::io
