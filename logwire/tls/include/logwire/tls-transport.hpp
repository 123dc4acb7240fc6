#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "logwire/tls-raii.hpp"
#include "logwire/transport.hpp"

namespace logwire {

// TLS transport (OpenSSL) over a connected non-blocking socket.
// The SSL object is already bound to the fd and set to connect or accept state.
class TlsTransport : public ITransport {
 public:
  explicit TlsTransport(SslPtr ssl) noexcept : _ssl(std::move(ssl)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportHint handshake() override;

  [[nodiscard]] bool handshakeDone() const noexcept override { return _handshakeDone; }

  // Best-effort close_notify (non-blocking). Safe to call multiple times.
  void shutdown() noexcept override;

  void logErrorIfAny() const noexcept;

 private:
  SslPtr _ssl;
  bool _handshakeDone{false};
};

}  // namespace logwire
