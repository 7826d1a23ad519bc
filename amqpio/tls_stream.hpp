#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <openssl/ssl.h>

#include "stream.hpp"

namespace amqpio::io {

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};

struct SslDeleter {
  void operator()(SSL* ssl) const { SSL_free(ssl); }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;
using SslPtr = std::unique_ptr<SSL, SslDeleter>;

// OpenSSL session over a connected, blocking TcpSocket.
//
// One reader and one writer may use the stream at the same time. SSL_read
// and SSL_write are serialized on mutex_; a reader waits for the socket to
// become readable before taking it, so an idle reader never holds up
// the writer.
class TlsStream final : public IStream {
 public:
  TlsStream(TcpSocket& socket, SslCtxPtr ctx, SslPtr ssl);
  ~TlsStream() override;

  TlsStream(const TlsStream&) = delete;
  TlsStream& operator=(const TlsStream&) = delete;

  size_t read(uint8_t* buf, size_t max_len) override;
  void write(const uint8_t* data, size_t len) override;

  // Sends close_notify unless the session is busy or already closed.
  void close() noexcept override;

  // "TLSv1.3" and so on.
  [[nodiscard]] std::string protocolVersion() const;

 private:
  TcpSocket& socket_;
  SslCtxPtr ctx_;
  SslPtr ssl_;
  mutable std::mutex mutex_;
  bool closed_ = false;
};

// Runs the client handshake on a connected socket, with the socket's read
// and write timeouts bounding it. Throws TransportError(TLS_FAILURE).
class TlsUpgrader final : public IStreamUpgrader {
 public:
  std::unique_ptr<IStream> upgrade(TcpSocket& socket, const SslOption& ssl,
                                   const std::string& host) override;
};

// Drains the calling thread's OpenSSL error queue into one line.
std::string sslErrorText();

}  // namespace amqpio::io
