#include "logwire/tls-transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "logwire/log.hpp"
#include "logwire/transport.hpp"

namespace logwire {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {

inline bool IsRetry(int code) { return code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE; }

inline TransportHint RetryHint(int code) {
  return code == SSL_ERROR_WANT_WRITE ? TransportHint::WriteReady : TransportHint::ReadReady;
}

}  // namespace

TransportHint TlsTransport::handshake() {
  if (_handshakeDone) {
    return TransportHint::None;
  }
  const int handshakeRet = ::SSL_do_handshake(_ssl.get());
  if (handshakeRet == 1) {
    _handshakeDone = true;
    log::debug("TLS handshake done ({} {})", ::SSL_get_version(_ssl.get()),
               ::SSL_CIPHER_get_name(::SSL_get_current_cipher(_ssl.get())));
    return TransportHint::None;
  }
  const int err = ::SSL_get_error(_ssl.get(), handshakeRet);
  if (IsRetry(err)) {
    return RetryHint(err);
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    return TransportHint::ReadReady;
  }
  const long verifyResult = ::SSL_get_verify_result(_ssl.get());
  if (verifyResult != X509_V_OK) {
    log::error("TLS peer verification failed: {}", ::X509_verify_cert_error_string(verifyResult));
  }
  logErrorIfAny();
  return TransportHint::Error;
}

ITransport::TransportResult TlsTransport::read(char* buf, std::size_t len) {
  TransportResult ret{0, handshake()};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  if (::SSL_read_ex(_ssl.get(), buf, len, &ret.bytesProcessed) == 1) [[likely]] {
    return ret;
  }

  ret.bytesProcessed = 0;
  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (err == SSL_ERROR_ZERO_RETURN) {
    // Clean shutdown from the peer.
    return ret;
  }
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::ReadReady;
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

ITransport::TransportResult TlsTransport::write(std::string_view data) {
  TransportResult ret{0, handshake()};
  if (ret.want != TransportHint::None) {
    return ret;
  }

  // OpenSSL rejects zero-length writes on some builds.
  if (data.empty() || ::SSL_write_ex(_ssl.get(), data.data(), data.size(), &ret.bytesProcessed) == 1) {
    return ret;
  }

  ret.bytesProcessed = 0;  // caller retries with same data
  const auto err = ::SSL_get_error(_ssl.get(), 0);
  if (IsRetry(err)) {
    ret.want = RetryHint(err);
    return ret;
  }
  if (err == SSL_ERROR_SYSCALL && errno == EAGAIN) {
    ret.want = TransportHint::WriteReady;
    return ret;
  }
  logErrorIfAny();
  ret.want = TransportHint::Error;
  return ret;
}

void TlsTransport::shutdown() noexcept {
  if (_ssl == nullptr || !_handshakeDone) {
    return;
  }
  // A second call only completes a bidirectional shutdown if the peer close_notify already arrived.
  if (::SSL_shutdown(_ssl.get()) == 0) {
    ::SSL_shutdown(_ssl.get());
  }
  ::ERR_clear_error();
}

void TlsTransport::logErrorIfAny() const noexcept {
  for (auto errVal = ::ERR_get_error(); errVal != 0; errVal = ::ERR_get_error()) {
    char errBuf[256];
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
    log::error("TLS transport OpenSSL error: {} (handshake done={})", std::string_view(errBuf), _handshakeDone);
  }
}

}  // namespace logwire
