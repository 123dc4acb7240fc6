#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "logwire/tls-raii.hpp"
#include "logwire/tls-transport.hpp"

namespace logwire {

struct TlsClientConfig {
  // Check the server certificate chain and host name.
  bool verifyPeer{true};
  // PEM file of trusted CAs. Empty means the system default verify paths.
  std::string caFile;
  // Trusted CA certificates given directly as PEM text (appended to the above).
  std::string caPem;
};

// Owns the OpenSSL client context shared by all connections of a session.
// Throws std::runtime_error if OpenSSL cannot build the context or load the trust material.
class TlsClientContext {
 public:
  explicit TlsClientContext(const TlsClientConfig& config);

  // Binds a new SSL object to 'fd' in connect state, with SNI and host name verification for 'serverName'.
  [[nodiscard]] std::unique_ptr<TlsTransport> createTransport(int fd, std::string_view serverName) const;

  [[nodiscard]] SSL_CTX* raw() const noexcept { return _ctx.get(); }

 private:
  SslCtxPtr _ctx;
  bool _verifyPeer;
};

}  // namespace logwire
