#include "connector.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include <folly/executors/GlobalExecutor.h>
#include <folly/futures/Future.h>

#include "error.hpp"
#include "timeout.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

using enum TransportError::Code;

void throwConnectFailure(std::exception_ptr cause) {
  throw TransportError(CONNECT_FAILURE, "Connection failed", std::move(cause));
}

std::unique_ptr<TcpSocket> TcpConnector::connect(const SocketAddress& remote,
                                                 const std::chrono::milliseconds timeout) {
  LOG(DEBUG) << "Connecting to " << remote << " timeout=" << timeout.count() << "ms";
  try {
    auto socket = TcpSocket::open(remote.family());
    socket->setNoDelay(options_.no_delay);
    socket->setReceiveBufferSize(options_.receive_buffer_size);
    socket->setSendBufferSize(options_.send_buffer_size);

    // The blocking connect is bounded by the same deadline, so the worker
    // never outlives it by much. A socket connected after the caller gave up
    // is closed when the dropped result is destroyed.
    auto pending = folly::via(folly::getGlobalCPUExecutor(),
                              [socket = std::move(socket), remote, timeout]() mutable {
                                socket->connect(remote, timeout);
                                return std::move(socket);
                              });
    auto connected = awaitWithin(std::move(pending), timeout);

    LOG(DEBUG) << "Connected to " << remote;
    return connected;
  } catch (const std::invalid_argument& e) {
    LOG(DEBUG) << "Connect to " << remote << " rejected: " << e.what();
    throwConnectFailure(std::current_exception());
  } catch (const std::system_error& e) {
    LOG(DEBUG) << "Connect to " << remote << " failed: " << e.what();
    throwConnectFailure(std::current_exception());
  } catch (const TransportError& e) {
    if (e.code() != TIMEOUT) {
      throw;
    }
    LOG(DEBUG) << "Connect to " << remote << " timed out";
    throwConnectFailure(std::current_exception());
  }
}

}  // namespace amqpio::io
