#include "tls_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <mutex>
#include <system_error>

#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include "error.hpp"
#include "wheels/logging.hpp"

namespace amqpio::io {

using enum TransportError::Code;

namespace {

[[noreturn]] void throwTlsFailure(const std::string& what) {
  const auto details = sslErrorText();
  throw TransportError(TLS_FAILURE,
                       details.empty() ? what : fmt::format("{}: {}", what, details));
}

int toNative(const TlsVersion version) {
  switch (version) {
    case TlsVersion::TLS1_2:
      return TLS1_2_VERSION;
    case TlsVersion::TLS1_3:
      return TLS1_3_VERSION;
  }
  return TLS1_2_VERSION;
}

SslCtxPtr makeContext(const SslOption& ssl) {
  SslCtxPtr ctx(SSL_CTX_new(TLS_client_method()));
  if (!ctx) {
    throwTlsFailure("Cannot create TLS context");
  }
  if (SSL_CTX_set_min_proto_version(ctx.get(), toNative(ssl.min_version)) != 1) {
    throwTlsFailure("Cannot set minimum TLS version");
  }
  // A peer dropping the connection reads as end of stream
  SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
  SSL_CTX_set_mode(ctx.get(), SSL_MODE_AUTO_RETRY);

  if (ssl.verify_peer) {
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (ssl.ca_file.empty()) {
      if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        throwTlsFailure("Cannot load the default trust store");
      }
    } else if (SSL_CTX_load_verify_locations(ctx.get(), ssl.ca_file.c_str(), nullptr) != 1) {
      throwTlsFailure(fmt::format("Cannot load CA file {}", ssl.ca_file));
    }
  } else {
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
  }

  if (ssl.cert_file.empty() != ssl.key_file.empty()) {
    throw TransportError(TLS_FAILURE, "Client certificate and key must be given together");
  }
  if (!ssl.cert_file.empty()) {
    if (SSL_CTX_use_certificate_chain_file(ctx.get(), ssl.cert_file.c_str()) != 1) {
      throwTlsFailure(fmt::format("Cannot load client certificate {}", ssl.cert_file));
    }
    if (SSL_CTX_use_PrivateKey_file(ctx.get(), ssl.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
      throwTlsFailure(fmt::format("Cannot load client key {}", ssl.key_file));
    }
    if (SSL_CTX_check_private_key(ctx.get()) != 1) {
      throwTlsFailure("Client key does not match the certificate");
    }
  }
  return ctx;
}

void setPeerName(SSL* ssl, const std::string& name, const bool verify) {
  const bool literal = IpAddress::parse(name).has_value();
  // SNI carries host names only
  if (!literal && SSL_set_tlsext_host_name(ssl, name.c_str()) != 1) {
    throwTlsFailure(fmt::format("Cannot set server name {}", name));
  }
  if (!verify) {
    return;
  }
  const int rc = literal ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), name.c_str())
                         : SSL_set1_host(ssl, name.c_str());
  if (rc != 1) {
    throwTlsFailure(fmt::format("Cannot set expected peer name {}", name));
  }
}

// OpenSSL writes to the socket without MSG_NOSIGNAL, so a peer reset
// would raise SIGPIPE instead of an error from SSL_write.
void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace

std::string sslErrorText() {
  std::string text;
  while (const unsigned long err = ERR_get_error()) {
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    if (!text.empty()) {
      text += "; ";
    }
    text += buf;
  }
  return text;
}

TlsStream::TlsStream(TcpSocket& socket, SslCtxPtr ctx, SslPtr ssl)
    : socket_(socket), ctx_(std::move(ctx)), ssl_(std::move(ssl)) {}

TlsStream::~TlsStream() = default;

size_t TlsStream::read(uint8_t* buf, const size_t max_len) {
  if (max_len == 0) {
    return 0;
  }
  const int want = static_cast<int>(std::min<size_t>(max_len, INT_MAX));
  while (true) {
    bool pending;
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return 0;
      }
      pending = SSL_pending(ssl_.get()) > 0;
    }

    if (!pending) {
      try {
        if (!socket_.waitReadable()) {
          throw TransportError(TIMEOUT, "TLS read timed out");
        }
      } catch (const std::system_error&) {
        rethrowAsIoError("read");
      }
    }

    std::lock_guard lock(mutex_);
    if (closed_) {
      return 0;
    }
    ERR_clear_error();
    const int n = SSL_read(ssl_.get(), buf, want);
    if (n > 0) {
      return static_cast<size_t>(n);
    }
    switch (SSL_get_error(ssl_.get(), n)) {
      case SSL_ERROR_ZERO_RETURN:
        return 0;
      case SSL_ERROR_WANT_READ:
      case SSL_ERROR_WANT_WRITE:
        // Partial record or a session ticket; wait for more
        continue;
      case SSL_ERROR_SYSCALL:
        if (errno == 0) {
          return 0;
        }
        throw TransportError(
            IO_ERROR, "TLS read failed",
            std::make_exception_ptr(std::system_error(errno, std::generic_category(), "recv")));
      default:
        throwTlsFailure("TLS read failed");
    }
  }
}

void TlsStream::write(const uint8_t* data, size_t len) {
  std::lock_guard lock(mutex_);
  if (closed_) {
    throw TransportError(IO_ERROR, "TLS stream is closed");
  }
  while (len > 0) {
    const int chunk = static_cast<int>(std::min<size_t>(len, INT_MAX));
    ERR_clear_error();
    const int n = SSL_write(ssl_.get(), data, chunk);
    if (n > 0) {
      data += n;
      len -= static_cast<size_t>(n);
      continue;
    }
    switch (SSL_get_error(ssl_.get(), n)) {
      case SSL_ERROR_WANT_READ:
      case SSL_ERROR_WANT_WRITE:
        // Blocking socket: the send timeout expired
        throw TransportError(TIMEOUT, "TLS write timed out");
      case SSL_ERROR_SYSCALL:
        throw TransportError(
            IO_ERROR, "TLS write failed",
            std::make_exception_ptr(std::system_error(errno, std::generic_category(), "send")));
      default:
        throwTlsFailure("TLS write failed");
    }
  }
}

void TlsStream::close() noexcept {
  std::unique_lock lock(mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    LOG(DEBUG) << "Skipping TLS close_notify, session busy";
    return;
  }
  if (closed_) {
    return;
  }
  closed_ = true;
  ERR_clear_error();
  if (SSL_shutdown(ssl_.get()) < 0) {
    LOG(DEBUG) << "TLS close_notify failed: " << sslErrorText();
  }
}

std::string TlsStream::protocolVersion() const {
  std::lock_guard lock(mutex_);
  return SSL_get_version(ssl_.get());
}

std::unique_ptr<IStream> TlsUpgrader::upgrade(TcpSocket& socket, const SslOption& ssl,
                                              const std::string& host) {
  ignoreSigpipe();
  ERR_clear_error();
  auto ctx = makeContext(ssl);

  SslPtr session(SSL_new(ctx.get()));
  if (!session) {
    throwTlsFailure("Cannot create TLS session");
  }
  if (SSL_set_fd(session.get(), socket.nativeHandle()) != 1) {
    throwTlsFailure("Cannot attach TLS session to socket");
  }

  const std::string& peer = ssl.server_name.empty() ? host : ssl.server_name;
  setPeerName(session.get(), peer, ssl.verify_peer);

  const int rc = SSL_connect(session.get());
  if (rc != 1) {
    const int err = SSL_get_error(session.get(), rc);
    const long verify = SSL_get_verify_result(session.get());
    if (verify != X509_V_OK) {
      ERR_clear_error();
      throw TransportError(TLS_FAILURE,
                           fmt::format("TLS handshake with {} failed: {}", peer,
                                       X509_verify_cert_error_string(verify)));
    }
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      throw TransportError(TLS_FAILURE, fmt::format("TLS handshake with {} timed out", peer));
    }
    throwTlsFailure(fmt::format("TLS handshake with {} failed", peer));
  }

  LOG(DEBUG) << "TLS established with " << peer << " using " << SSL_get_version(session.get())
             << " " << SSL_get_cipher(session.get());
  return std::make_unique<TlsStream>(socket, std::move(ctx), std::move(session));
}

}  // namespace amqpio::io
