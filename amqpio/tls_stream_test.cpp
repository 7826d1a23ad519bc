#include "tls_stream.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <latch>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "error.hpp"

using namespace amqpio;
using namespace amqpio::io;
using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

struct X509Deleter {
  void operator()(X509* cert) const { X509_free(cert); }
};

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct FileCloser {
  void operator()(FILE* f) const { std::fclose(f); }
};

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Self-signed certificate for "localhost" and 127.0.0.1.
X509Ptr makeCertificate(EVP_PKEY* key) {
  X509Ptr cert(X509_new());
  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
  X509_set_pubkey(cert.get(), key);

  X509_NAME* name = X509_get_subject_name(cert.get());
  X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                             reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
  X509_set_issuer_name(cert.get(), name);

  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
  X509_EXTENSION* san =
      X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, "DNS:localhost,IP:127.0.0.1");
  X509_add_ext(cert.get(), san, -1);
  X509_EXTENSION_free(san);

  X509_sign(cert.get(), key, EVP_sha256());
  return cert;
}

// Loopback TLS (or plain) peer served from its own thread.
class Peer {
 public:
  Peer(X509* cert, EVP_PKEY* key)
      : listener_(TcpServerSocket::listen("127.0.0.1", 0)),
        ctx_(SSL_CTX_new(TLS_server_method())) {
    SSL_CTX_use_certificate(ctx_.get(), cert);
    SSL_CTX_use_PrivateKey(ctx_.get(), key);
  }

  ~Peer() { join(); }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  uint16_t port() const { return listener_->port(); }

  template <typename Behaviour>
  void serve(Behaviour behaviour) {
    thread_ = std::thread([this, behaviour]() mutable {
      auto socket = listener_->accept();
      socket->setReceiveTimeout(5s);
      socket->setSendTimeout(5s);
      behaviour(*socket);
    });
  }

  // Null when the client aborted the handshake.
  SslPtr handshake(TcpSocket& socket) {
    SslPtr ssl(SSL_new(ctx_.get()));
    SSL_set_fd(ssl.get(), socket.nativeHandle());
    if (SSL_accept(ssl.get()) != 1) {
      return nullptr;
    }
    return ssl;
  }

 private:
  std::unique_ptr<TcpServerSocket> listener_;
  SslCtxPtr ctx_;
  std::thread thread_;
};

class TlsStreamTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    key_ = PkeyPtr(EVP_EC_gen("P-256"));
    cert_ = makeCertificate(key_.get());

    dir_ = std::filesystem::temp_directory_path() / fmt::format("amqpio-tls-{}", ::getpid());
    std::filesystem::create_directories(dir_);
    FilePtr cert_file(std::fopen(certPath().c_str(), "w"));
    PEM_write_X509(cert_file.get(), cert_.get());
    FilePtr key_file(std::fopen(keyPath().c_str(), "w"));
    PEM_write_PrivateKey(key_file.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr);
  }

  static void TearDownTestSuite() {
    std::filesystem::remove_all(dir_);
    cert_.reset();
    key_.reset();
  }

  static std::string certPath() { return (dir_ / "server.pem").string(); }
  static std::string keyPath() { return (dir_ / "server.key").string(); }

  static SslOption trusting() {
    SslOption ssl;
    ssl.enabled = true;
    ssl.ca_file = certPath();
    return ssl;
  }

  static std::unique_ptr<TcpSocket> connectTo(uint16_t port) {
    auto socket = TcpSocket::open(AddressFamily::IPv4);
    socket->connect({IpAddress::parse("127.0.0.1").value(), port}, 5s);
    socket->setReceiveTimeout(5s);
    socket->setSendTimeout(5s);
    return socket;
  }

  static TransportError upgradeFailure(TcpSocket& socket, const SslOption& ssl,
                                       const std::string& host = "localhost") {
    try {
      TlsUpgrader().upgrade(socket, ssl, host);
    } catch (const TransportError& e) {
      return e;
    }
    ADD_FAILURE() << "TLS upgrade succeeded";
    return TransportError(TransportError::Code::IO_ERROR);
  }

  static PkeyPtr key_;
  static X509Ptr cert_;
  static std::filesystem::path dir_;
};

PkeyPtr TlsStreamTest::key_;
X509Ptr TlsStreamTest::cert_;
std::filesystem::path TlsStreamTest::dir_;

}  // namespace

TEST_F(TlsStreamTest, ExchangesDataWithTrustedServer) {
  Peer peer(cert_.get(), key_.get());
  std::atomic<bool> saw_close_notify{false};
  peer.serve([&](TcpSocket& socket) {
    auto ssl = peer.handshake(socket);
    ASSERT_TRUE(ssl);
    char buf[4];
    int got = 0;
    while (got < 4) {
      const int n = SSL_read(ssl.get(), buf + got, 4 - got);
      ASSERT_GT(n, 0);
      got += n;
    }
    SSL_write(ssl.get(), buf, 4);
    const int n = SSL_read(ssl.get(), buf, sizeof(buf));
    saw_close_notify = n == 0 && SSL_get_error(ssl.get(), n) == SSL_ERROR_ZERO_RETURN;
  });

  auto socket = connectTo(peer.port());
  auto stream = TlsUpgrader().upgrade(*socket, trusting(), "localhost");
  auto* tls = dynamic_cast<TlsStream*>(stream.get());
  ASSERT_NE(tls, nullptr);
  EXPECT_THAT(tls->protocolVersion(), StartsWith("TLSv1."));

  const uint8_t ping[] = {'p', 'i', 'n', 'g'};
  stream->write(ping, sizeof(ping));
  uint8_t echo[4];
  size_t got = 0;
  while (got < sizeof(echo)) {
    const size_t n = stream->read(echo + got, sizeof(echo) - got);
    ASSERT_GT(n, 0);
    got += n;
  }
  EXPECT_EQ(std::string(echo, echo + 4), "ping");

  stream->close();
  peer.join();
  EXPECT_TRUE(saw_close_notify);
}

TEST_F(TlsStreamTest, VerifiesIpLiteralAgainstSubjectAltName) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) {
    auto ssl = peer.handshake(socket);
    if (ssl) {
      SSL_shutdown(ssl.get());
    }
  });

  auto socket = connectTo(peer.port());
  auto stream = TlsUpgrader().upgrade(*socket, trusting(), "127.0.0.1");

  uint8_t byte;
  EXPECT_EQ(stream->read(&byte, 1), 0);
}

TEST_F(TlsStreamTest, ServerCloseNotifyIsEndOfStream) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) {
    auto ssl = peer.handshake(socket);
    ASSERT_TRUE(ssl);
    SSL_shutdown(ssl.get());
  });

  auto socket = connectTo(peer.port());
  auto stream = TlsUpgrader().upgrade(*socket, trusting(), "localhost");

  uint8_t buf[16];
  EXPECT_EQ(stream->read(buf, sizeof(buf)), 0);
}

TEST_F(TlsStreamTest, WriteAfterCloseFails) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) { peer.handshake(socket); });

  auto socket = connectTo(peer.port());
  auto stream = TlsUpgrader().upgrade(*socket, trusting(), "localhost");
  stream->close();
  stream->close();

  const uint8_t byte = 1;
  try {
    stream->write(&byte, 1);
    FAIL() << "Wrote to a closed TLS stream";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.code(), TransportError::Code::IO_ERROR);
  }
  uint8_t buf;
  EXPECT_EQ(stream->read(&buf, 1), 0);
}

TEST_F(TlsStreamTest, UntrustedServerIsRejected) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) { peer.handshake(socket); });

  auto socket = connectTo(peer.port());
  SslOption ssl;
  ssl.enabled = true;

  const auto error = upgradeFailure(*socket, ssl);

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
  EXPECT_THAT(error.what(), HasSubstr("TLS handshake with localhost failed"));
}

TEST_F(TlsStreamTest, MismatchedServerNameIsRejected) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) { peer.handshake(socket); });

  auto socket = connectTo(peer.port());
  auto ssl = trusting();
  ssl.server_name = "broker.example.com";

  const auto error = upgradeFailure(*socket, ssl);

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
  EXPECT_THAT(error.what(), HasSubstr("broker.example.com"));
}

TEST_F(TlsStreamTest, UnverifiedSessionAcceptsAnyCertificate) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([&](TcpSocket& socket) {
    auto ssl = peer.handshake(socket);
    if (ssl) {
      SSL_shutdown(ssl.get());
    }
  });

  auto socket = connectTo(peer.port());
  SslOption ssl;
  ssl.enabled = true;
  ssl.verify_peer = false;

  auto stream = TlsUpgrader().upgrade(*socket, ssl, "broker.example.com");
  uint8_t byte;
  EXPECT_EQ(stream->read(&byte, 1), 0);
}

TEST_F(TlsStreamTest, PlainPeerClosingDuringHandshakeFails) {
  Peer peer(cert_.get(), key_.get());
  peer.serve([](TcpSocket& socket) { socket.close(); });

  auto socket = connectTo(peer.port());
  auto ssl = trusting();

  EXPECT_EQ(upgradeFailure(*socket, ssl).code(), TransportError::Code::TLS_FAILURE);
}

TEST_F(TlsStreamTest, PlainPeerSendingJunkFails) {
  Peer peer(cert_.get(), key_.get());
  std::latch client_done(1);
  peer.serve([&](TcpSocket& socket) {
    const std::string junk = "HTTP/1.1 400 Bad Request\r\n\r\n";
    socket.send(reinterpret_cast<const uint8_t*>(junk.data()), junk.size());
    client_done.wait();
  });

  auto socket = connectTo(peer.port());
  const auto error = upgradeFailure(*socket, trusting());
  client_done.count_down();

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
  EXPECT_THAT(error.what(), HasSubstr("TLS handshake with localhost failed"));
}

TEST_F(TlsStreamTest, CertificateWithoutKeyIsRejected) {
  auto socket = TcpSocket::open(AddressFamily::IPv4);
  auto ssl = trusting();
  ssl.cert_file = certPath();

  const auto error = upgradeFailure(*socket, ssl);

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
  EXPECT_STREQ(error.what(), "Client certificate and key must be given together");
}

TEST_F(TlsStreamTest, UnreadableCaFileIsRejected) {
  auto socket = TcpSocket::open(AddressFamily::IPv4);
  auto ssl = trusting();
  ssl.ca_file = (dir_ / "missing-ca.pem").string();

  const auto error = upgradeFailure(*socket, ssl);

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
  EXPECT_THAT(error.what(), StartsWith("Cannot load CA file"));
}

TEST_F(TlsStreamTest, MismatchedClientKeyIsRejected) {
  const PkeyPtr other(EVP_EC_gen("P-256"));
  const auto other_key = (dir_ / "other.key").string();
  {
    FilePtr f(std::fopen(other_key.c_str(), "w"));
    PEM_write_PrivateKey(f.get(), other.get(), nullptr, nullptr, 0, nullptr, nullptr);
  }
  auto socket = TcpSocket::open(AddressFamily::IPv4);
  auto ssl = trusting();
  ssl.cert_file = certPath();
  ssl.key_file = other_key;

  const auto error = upgradeFailure(*socket, ssl);

  EXPECT_EQ(error.code(), TransportError::Code::TLS_FAILURE);
}

TEST(SslErrorTextTest, EmptyQueueIsEmptyText) {
  ERR_clear_error();
  EXPECT_EQ(sslErrorText(), "");
}
