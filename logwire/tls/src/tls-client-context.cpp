#include "logwire/tls-client-context.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/tls-raii.hpp"
#include "logwire/tls-transport.hpp"

namespace logwire {

namespace {

[[noreturn]] void ThrowSslError(std::string_view what) {
  char errBuf[256]{};
  const auto errVal = ::ERR_get_error();
  if (errVal != 0) {
    ::ERR_error_string_n(errVal, errBuf, sizeof(errBuf));
  }
  ::ERR_clear_error();
  throw std::runtime_error(fmt::format("{}: {}", what, std::string_view(errBuf)));
}

void AddPemCertificates(SSL_CTX* ctx, std::string_view pem) {
  std::unique_ptr<BIO, decltype(&::BIO_free)> bio(::BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())),
                                                  ::BIO_free);
  if (bio == nullptr) {
    ThrowSslError("BIO_new_mem_buf failed");
  }
  X509_STORE* store = ::SSL_CTX_get_cert_store(ctx);
  int nbAdded = 0;
  while (true) {
    std::unique_ptr<X509, decltype(&::X509_free)> cert(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr),
                                                       ::X509_free);
    if (cert == nullptr) {
      break;
    }
    if (::X509_STORE_add_cert(store, cert.get()) != 1) {
      ThrowSslError("X509_STORE_add_cert failed");
    }
    ++nbAdded;
  }
  // End of PEM data is reported as an error
  ::ERR_clear_error();
  if (nbAdded == 0) {
    throw std::runtime_error("No certificate found in CA PEM data");
  }
}

}  // namespace

TlsClientContext::TlsClientContext(const TlsClientConfig& config)
    : _ctx(::SSL_CTX_new(TLS_client_method()), ::SSL_CTX_free), _verifyPeer(config.verifyPeer) {
  if (_ctx == nullptr) {
    ThrowSslError("SSL_CTX_new failed");
  }
  if (::SSL_CTX_set_min_proto_version(_ctx.get(), TLS1_2_VERSION) != 1) {
    ThrowSslError("Unable to set minimum TLS version");
  }

  if (!config.verifyPeer) {
    log::warn("TLS peer verification is disabled");
    ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_NONE, nullptr);
    return;
  }

  ::SSL_CTX_set_verify(_ctx.get(), SSL_VERIFY_PEER, nullptr);
  if (config.caFile.empty() && config.caPem.empty()) {
    if (::SSL_CTX_set_default_verify_paths(_ctx.get()) != 1) {
      ThrowSslError("Unable to load default CA paths");
    }
  }
  if (!config.caFile.empty() && ::SSL_CTX_load_verify_locations(_ctx.get(), config.caFile.c_str(), nullptr) != 1) {
    ThrowSslError(fmt::format("Unable to load CA file '{}'", config.caFile));
  }
  if (!config.caPem.empty()) {
    AddPemCertificates(_ctx.get(), config.caPem);
  }
}

std::unique_ptr<TlsTransport> TlsClientContext::createTransport(int fd, std::string_view serverName) const {
  SslPtr ssl(::SSL_new(_ctx.get()), ::SSL_free);
  if (ssl == nullptr) {
    ThrowSslError("SSL_new failed");
  }
  if (::SSL_set_fd(ssl.get(), fd) != 1) {
    ThrowSslError("SSL_set_fd failed");
  }
  const std::string name(serverName);
  // SNI must not carry IP literals, the host check still applies to them through the certificate
  const bool isIpLiteral = name.find_first_not_of("0123456789.:") == std::string::npos;
  if (!isIpLiteral && ::SSL_set_tlsext_host_name(ssl.get(), name.c_str()) != 1) {
    ThrowSslError("Unable to set TLS server name");
  }
  if (_verifyPeer && ::SSL_set1_host(ssl.get(), name.c_str()) != 1) {
    ThrowSslError("Unable to set TLS verification host name");
  }
  ::SSL_set_connect_state(ssl.get());
  return std::make_unique<TlsTransport>(std::move(ssl));
}

}  // namespace logwire
