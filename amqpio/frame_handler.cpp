#include "frame_handler.hpp"

#include <limits>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "dual_stack.hpp"
#include "tls_stream.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

namespace {

Collaborators withDefaults(Collaborators c) {
  if (!c.resolver) {
    c.resolver = std::make_shared<SystemResolver>();
  }
  if (!c.connector) {
    c.connector = std::make_shared<TcpConnector>();
  }
  if (!c.upgrader) {
    c.upgrader = std::make_shared<TlsUpgrader>();
  }
  if (!c.pool) {
    c.pool = BufferPool::shared();
  }
  if (!c.events) {
    c.events = std::make_shared<NullEventSink>();
  }
  return c;
}

void checkPort(const Endpoint& endpoint) {
  if (endpoint.port == Endpoint::kUseDefaultPort) {
    return;
  }
  if (endpoint.port < 0 || endpoint.port > std::numeric_limits<uint16_t>::max()) {
    throwConnectFailure(std::make_exception_ptr(
        std::invalid_argument(fmt::format("Port {} is out of range", endpoint.port))));
  }
}

}  // namespace

const char* toString(const SocketFrameHandler::State state) {
  switch (state) {
    case SocketFrameHandler::State::Constructing:
      return "Constructing";
    case SocketFrameHandler::State::Connected:
      return "Connected";
    case SocketFrameHandler::State::Closed:
      return "Closed";
  }
  return "Unknown";
}

SocketFrameHandler::SocketFrameHandler(Endpoint endpoint, const FrameHandlerOptions options,
                                       Collaborators collaborators)
    : endpoint_(std::move(endpoint)),
      options_(options),
      collaborators_(withDefaults(std::move(collaborators))) {
  checkPort(endpoint_);
  DualStackConnector connector(*collaborators_.resolver, *collaborators_.connector,
                               collaborators_.ipv6_supported.value_or(platformSupportsIPv6()));

  LOG(DEBUG) << "Connecting to " << endpoint_.toString();
  socket_ = connector.connect(endpoint_.host, endpoint_.effectivePort(), endpoint_.address_family,
                              options_.connection_timeout);

  // Socket faults during setup mean the connection died under us
  try {
    setupStreams();
    local_ = socket_->localAddress();
    remote_ = socket_->remoteAddress();
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Connection to " << endpoint_.toString() << " lost during setup: " << e.what();
    if (stream_) {
      stream_->close();
    }
    throwConnectFailure(std::current_exception());
  }

  // The writer goes last: nothing below may fail once it runs
  pipeline_ = std::make_unique<WritePipeline>(*writer_, *collaborators_.events);

  std::lock_guard lock(state_mutex_);
  state_ = State::Connected;
  LOG(INFO) << "Connected to " << endpoint_.toString() << " at " << remote_ << " from " << local_;
}

SocketFrameHandler::~SocketFrameHandler() {
  close();
}

void SocketFrameHandler::setupStreams() {
  socket_->setReceiveTimeout(options_.read_timeout);
  socket_->setSendTimeout(options_.write_timeout);

  if (endpoint_.ssl.enabled) {
    try {
      stream_ = collaborators_.upgrader->upgrade(*socket_, endpoint_.ssl, endpoint_.host);
    } catch (const std::exception& e) {
      LOG(ERROR) << "TLS upgrade for " << endpoint_.toString() << " failed: " << e.what();
      socket_->close();
      throw;
    }
  } else {
    stream_ = std::make_unique<SocketStream>(*socket_);
  }

  reader_ = std::make_unique<BufferedReader>(*stream_, socket_->receiveBufferSize());
  writer_ = std::make_unique<BufferedWriter>(*stream_, socket_->sendBufferSize());
}

void SocketFrameHandler::sendProtocolHeader() {
  const auto header = protocolHeader(endpoint_.protocol);
  pipeline_->writeImmediately(header);
}

InboundFrame SocketFrameHandler::readFrame() {
  return io::readFrame(*reader_, endpoint_.max_message_size, *collaborators_.pool);
}

bool SocketFrameHandler::write(PooledBuffer&& frame) {
  return pipeline_->enqueue(std::move(frame));
}

void SocketFrameHandler::close() noexcept {
  std::lock_guard lock(state_mutex_);
  if (state_ != State::Connected) {
    return;
  }

  try {
    pipeline_->close();
  } catch (const std::exception& e) {
    LOG(DEBUG) << "Ignoring writer shutdown failure: " << e.what();
  }

  stream_->close();

  try {
    socket_->close();
  } catch (const std::exception& e) {
    LOG(DEBUG) << "Ignoring socket close failure: " << e.what();
  }

  state_ = State::Closed;
  LOG(DEBUG) << "Closed connection to " << endpoint_.toString();
}

void SocketFrameHandler::setReadTimeout(const std::chrono::milliseconds timeout) {
  try {
    socket_->setReceiveTimeout(timeout);
  } catch (const std::system_error& e) {
    LOG(DEBUG) << "Ignoring read timeout change: " << e.what();
  }
}

void SocketFrameHandler::setWriteTimeout(const std::chrono::milliseconds timeout) {
  try {
    socket_->setSendTimeout(timeout);
  } catch (const std::system_error& e) {
    LOG(DEBUG) << "Ignoring write timeout change: " << e.what();
  }
}

SocketFrameHandler::State SocketFrameHandler::state() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

}  // namespace amqpio::io
