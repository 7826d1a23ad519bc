#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace amqpio {

class TransportError final : public std::runtime_error {
public:
  enum class Code : uint16_t {
    CONNECT_FAILURE,
    RESOLUTION_FAILURE,
    TIMEOUT,
    IO_ERROR,
    END_OF_STREAM,
    MALFORMED_FRAME,
    CONTENT_TOO_LARGE,
    PROTOCOL_MISMATCH,
    TLS_FAILURE,
  };
  explicit TransportError(const Code code) : TransportError(code, codeName(code)){};
  explicit TransportError(const Code code, const std::string& m,
                          std::exception_ptr cause = nullptr)
      : runtime_error(withCause(m, cause)), code_(code), cause_(std::move(cause)){};

  [[nodiscard]] Code code() const { return code_; }

  // The fault this error was raised for, if any.
  [[nodiscard]] std::exception_ptr cause() const { return cause_; }

  // Framing errors leave the inbound stream at an unknown offset.
  [[nodiscard]] bool isFramingError() const {
    return code_ == Code::MALFORMED_FRAME || code_ == Code::CONTENT_TOO_LARGE ||
           code_ == Code::PROTOCOL_MISMATCH;
  }

  static const char* codeName(const Code code) {
    switch (code) {
      case Code::CONNECT_FAILURE:
        return "connection failed";
      case Code::RESOLUTION_FAILURE:
        return "address resolution failed";
      case Code::TIMEOUT:
        return "timed out";
      case Code::IO_ERROR:
        return "i/o error";
      case Code::END_OF_STREAM:
        return "end of stream";
      case Code::MALFORMED_FRAME:
        return "malformed frame";
      case Code::CONTENT_TOO_LARGE:
        return "content too large";
      case Code::PROTOCOL_MISMATCH:
        return "protocol version mismatch";
      case Code::TLS_FAILURE:
        return "tls failure";
    }
    return "unknown";
  }

private:
  // Causes are always std::exception subclasses.
  static std::string withCause(const std::string& m, const std::exception_ptr& cause) {
    if (!cause) {
      return m;
    }
    try {
      std::rethrow_exception(cause);
    } catch (const std::exception& e) {
      return m + ": " + e.what();
    }
  }

  Code code_;
  std::exception_ptr cause_;
};

}  // namespace amqpio
