#pragma once

#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <folly/futures/Future.h>

#include "error.hpp"

namespace amqpio {

// Blocks until the pending operation settles or the timeout passes.
//
// The operation's own exception is rethrown as is; an expired deadline is
// TransportError(TIMEOUT) with folly::FutureTimeout as its cause. When the
// deadline wins, the operation keeps running and its eventual result, value
// or exception, is dropped by folly once it lands: a late exception is never
// rethrown anywhere and a late value is destroyed, releasing what it owns.
template <typename T>
T awaitWithin(folly::SemiFuture<T> pending, const std::chrono::milliseconds timeout) {
  try {
    return std::move(pending).within(timeout).get();
  } catch (const folly::FutureTimeout&) {
    throw TransportError(TransportError::Code::TIMEOUT,
                         fmt::format("Operation timed out after {}ms", timeout.count()),
                         std::current_exception());
  }
}

template <typename T>
T awaitWithin(folly::Future<T> pending, const std::chrono::milliseconds timeout) {
  return awaitWithin(std::move(pending).semi(), timeout);
}

}  // namespace amqpio
