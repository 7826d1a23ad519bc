#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "address.hpp"
#include "buffer_pool.hpp"
#include "buffered_stream.hpp"
#include "connector.hpp"
#include "endpoint.hpp"
#include "frame.hpp"
#include "stream.hpp"
#include "tcp_socket.hpp"
#include "write_pipeline.hpp"

namespace amqpio::io {

struct FrameHandlerOptions {
  // Per connection attempt; the IPv6 and IPv4 attempts get one each.
  std::chrono::milliseconds connection_timeout = std::chrono::seconds(30);
  std::chrono::milliseconds read_timeout = std::chrono::seconds(30);
  std::chrono::milliseconds write_timeout = std::chrono::seconds(30);
};

// Replaceable parts of the transport. Empty members get the defaults:
// SystemResolver, TcpConnector, TlsUpgrader, BufferPool::shared(), a sink
// that drops events and the platform IPv6 probe.
struct Collaborators {
  std::shared_ptr<IResolver> resolver;
  std::shared_ptr<IConnector> connector;
  std::shared_ptr<IStreamUpgrader> upgrader;
  std::shared_ptr<BufferPool> pool;
  std::shared_ptr<IEventSink> events;
  std::optional<bool> ipv6_supported;
};

//
// One AMQP connection's transport. The constructor connects, optionally
// secures the stream and starts the writer; it throws if any of that fails.
//
//   Constructing --ok--> Connected --close()--> Closed
//
// Threading: any number of threads may write(), one thread reads frames,
// close() may come from anywhere, any number of times.
//
class SocketFrameHandler {
 public:
  enum class State : uint8_t {
    Constructing,
    Connected,
    Closed,
  };

  explicit SocketFrameHandler(Endpoint endpoint, FrameHandlerOptions options = {},
                              Collaborators collaborators = {});
  ~SocketFrameHandler();

  SocketFrameHandler(const SocketFrameHandler&) = delete;
  SocketFrameHandler& operator=(const SocketFrameHandler&) = delete;

  // Writes the 8-byte protocol header and flushes it.
  void sendProtocolHeader();

  // Blocks for the next inbound frame.
  InboundFrame readFrame();

  // Hands a serialized frame to the writer. False once closed.
  bool write(PooledBuffer&& frame);

  // Drains queued frames, then tears down the stream and the socket.
  void close() noexcept;

  void setReadTimeout(std::chrono::milliseconds timeout);
  void setWriteTimeout(std::chrono::milliseconds timeout);

  [[nodiscard]] const Endpoint& endpoint() const { return endpoint_; }
  [[nodiscard]] const SocketAddress& localEndpoint() const { return local_; }
  [[nodiscard]] uint16_t localPort() const { return local_.port(); }
  [[nodiscard]] const SocketAddress& remoteEndpoint() const { return remote_; }
  [[nodiscard]] uint16_t remotePort() const { return remote_.port(); }

  [[nodiscard]] State state() const;
  [[nodiscard]] BufferPool& pool() const { return *collaborators_.pool; }

 private:
  void setupStreams();

  Endpoint endpoint_;
  FrameHandlerOptions options_;
  Collaborators collaborators_;

  std::unique_ptr<TcpSocket> socket_;
  std::unique_ptr<IStream> stream_;
  std::unique_ptr<BufferedReader> reader_;
  std::unique_ptr<BufferedWriter> writer_;
  std::unique_ptr<WritePipeline> pipeline_;
  SocketAddress local_;
  SocketAddress remote_;

  mutable std::mutex state_mutex_;
  State state_ = State::Constructing;
};

const char* toString(SocketFrameHandler::State state);

}  // namespace amqpio::io
