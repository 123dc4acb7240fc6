#include <fcntl.h>
#include <gtest/gtest.h>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "logwire/base-fd.hpp"
#include "logwire/test-tls-helper.hpp"
#include "logwire/tls-client-context.hpp"
#include "logwire/tls-raii.hpp"
#include "logwire/tls-transport.hpp"
#include "logwire/transport.hpp"

namespace logwire {

namespace {

SslCtxPtr MakeServerCtx(const std::string& certPem, const std::string& keyPem) {
  SslCtxPtr ctx(::SSL_CTX_new(TLS_server_method()), ::SSL_CTX_free);
  std::unique_ptr<BIO, decltype(&::BIO_free)> certBio(
      ::BIO_new_mem_buf(certPem.data(), static_cast<int>(certPem.size())), ::BIO_free);
  std::unique_ptr<BIO, decltype(&::BIO_free)> keyBio(::BIO_new_mem_buf(keyPem.data(), static_cast<int>(keyPem.size())),
                                                     ::BIO_free);
  std::unique_ptr<X509, decltype(&::X509_free)> cert(::PEM_read_bio_X509(certBio.get(), nullptr, nullptr, nullptr),
                                                     ::X509_free);
  std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)> key(
      ::PEM_read_bio_PrivateKey(keyBio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
  if (ctx == nullptr || cert == nullptr || key == nullptr || ::SSL_CTX_use_certificate(ctx.get(), cert.get()) != 1 ||
      ::SSL_CTX_use_PrivateKey(ctx.get(), key.get()) != 1) {
    throw std::runtime_error("Unable to build server TLS context");
  }
  return ctx;
}

// Blocking echo server answering one message with "pong:<message>".
void ServeOnce(SSL_CTX* ctx, int fd) {
  SslPtr ssl(::SSL_new(ctx), ::SSL_free);
  ::SSL_set_fd(ssl.get(), fd);
  if (::SSL_accept(ssl.get()) != 1) {
    return;
  }
  std::array<char, 256> buf;
  std::size_t nbRead = 0;
  if (::SSL_read_ex(ssl.get(), buf.data(), buf.size(), &nbRead) != 1) {
    return;
  }
  const std::string answer = "pong:" + std::string(buf.data(), nbRead);
  std::size_t nbWritten = 0;
  ::SSL_write_ex(ssl.get(), answer.data(), answer.size(), &nbWritten);
  ::SSL_shutdown(ssl.get());
}

bool WaitFor(int fd, TransportHint hint) {
  pollfd pfd{fd, static_cast<short>(hint == TransportHint::WriteReady ? POLLOUT : POLLIN), 0};
  return ::poll(&pfd, 1, 5000) == 1;
}

TransportHint DriveHandshake(ITransport& transport, int fd) {
  while (true) {
    const TransportHint hint = transport.handshake();
    if (hint == TransportHint::None || hint == TransportHint::Error) {
      return hint;
    }
    if (!WaitFor(fd, hint)) {
      return TransportHint::Error;
    }
  }
}

struct SocketPair {
  SocketPair() {
    std::array<int, 2> fds;
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()) != 0) {
      throw std::runtime_error("socketpair failed");
    }
    client = BaseFd(fds[0]);
    server = BaseFd(fds[1]);
    ::fcntl(client.fd(), F_SETFL, ::fcntl(client.fd(), F_GETFL) | O_NONBLOCK);
  }

  BaseFd client;
  BaseFd server;
};

}  // namespace

TEST(TlsTransportTest, HandshakeAndEchoWithoutVerification) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  ASSERT_FALSE(certPem.empty());
  auto serverCtx = MakeServerCtx(certPem, keyPem);

  SocketPair sockets;
  std::jthread serverThread(ServeOnce, serverCtx.get(), sockets.server.fd());

  TlsClientContext clientCtx(TlsClientConfig{.verifyPeer = false});
  auto transport = clientCtx.createTransport(sockets.client.fd(), "localhost");
  ASSERT_EQ(DriveHandshake(*transport, sockets.client.fd()), TransportHint::None);
  EXPECT_TRUE(transport->handshakeDone());

  auto writeRes = transport->write("hello");
  while (writeRes.want != TransportHint::None && writeRes.want != TransportHint::Error) {
    ASSERT_TRUE(WaitFor(sockets.client.fd(), writeRes.want));
    writeRes = transport->write("hello");
  }
  ASSERT_EQ(writeRes.want, TransportHint::None);
  EXPECT_EQ(writeRes.bytesProcessed, 5U);

  std::string received;
  std::array<char, 64> buf;
  while (true) {
    const auto readRes = transport->read(buf.data(), buf.size());
    if (readRes.want == TransportHint::ReadReady || readRes.want == TransportHint::WriteReady) {
      ASSERT_TRUE(WaitFor(sockets.client.fd(), readRes.want));
      continue;
    }
    ASSERT_NE(readRes.want, TransportHint::Error);
    if (readRes.bytesProcessed == 0) {
      break;  // close_notify
    }
    received.append(buf.data(), readRes.bytesProcessed);
  }
  EXPECT_EQ(received, "pong:hello");
  transport->shutdown();
}

TEST(TlsTransportTest, UntrustedServerCertificateFailsHandshake) {
  const auto [certPem, keyPem] = test::MakeEphemeralCertKey();
  const auto [otherCertPem, otherKeyPem] = test::MakeEphemeralCertKey("other");
  ASSERT_FALSE(otherCertPem.empty());
  auto serverCtx = MakeServerCtx(certPem, keyPem);

  SocketPair sockets;
  std::jthread serverThread(ServeOnce, serverCtx.get(), sockets.server.fd());

  TlsClientContext clientCtx(TlsClientConfig{.verifyPeer = true, .caPem = otherCertPem});
  auto transport = clientCtx.createTransport(sockets.client.fd(), "localhost");
  EXPECT_EQ(DriveHandshake(*transport, sockets.client.fd()), TransportHint::Error);
  EXPECT_FALSE(transport->handshakeDone());
  // Unblocks the server if it still waits for client data
  sockets.client.close();
}

TEST(TlsClientContextTest, MissingCaFileThrows) {
  EXPECT_THROW(TlsClientContext(TlsClientConfig{.caFile = "/nonexistent/logwire-ca.pem"}), std::runtime_error);
}

TEST(TlsClientContextTest, InvalidCaPemThrows) {
  EXPECT_THROW(TlsClientContext(TlsClientConfig{.caPem = "not a certificate"}), std::runtime_error);
}

}  // namespace logwire
