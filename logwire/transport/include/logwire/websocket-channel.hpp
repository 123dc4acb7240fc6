#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "logwire/channel.hpp"
#include "logwire/counter-fd.hpp"
#include "logwire/transport-config.hpp"
#include "logwire/websocket-url.hpp"

#ifdef LOGWIRE_ENABLE_OPENSSL
#include "logwire/tls-client-context.hpp"
#endif

namespace logwire {

// Channel implementation over a real RFC 6455 WebSocket client connection (ws:// or wss://).
// All socket I/O happens on one dedicated thread driving an epoll loop.
class WebSocketChannel final : public Channel {
 public:
  // Throws std::invalid_argument on an invalid configuration, std::runtime_error if the TLS context cannot be built.
  explicit WebSocketChannel(const TransportConfig& config);

  WebSocketChannel(const WebSocketChannel&) = delete;
  WebSocketChannel(WebSocketChannel&&) = delete;
  WebSocketChannel& operator=(const WebSocketChannel&) = delete;
  WebSocketChannel& operator=(WebSocketChannel&&) = delete;

  // Performs a best effort close handshake (bounded by the close timeout) and joins the I/O thread.
  ~WebSocketChannel() override;

  void open(Callbacks callbacks) override;

  void send(std::string text) override;

  void close() override;

  [[nodiscard]] const websocket::WebSocketUrl& url() const noexcept { return _url; }

 private:
  class Connection;

  void run(const std::stop_token& stopToken);

  [[nodiscard]] bool closeRequested(const std::stop_token& stopToken) const noexcept {
    return _closeRequested.load(std::memory_order_acquire) || stopToken.stop_requested();
  }

  websocket::WebSocketUrl _url;
  std::size_t _maxMessageSize;
#ifdef LOGWIRE_ENABLE_OPENSSL
  std::unique_ptr<TlsClientContext> _tlsContext;
#endif
  Callbacks _callbacks;
  WakeupFd _wakeFd;
  std::mutex _outboxMutex;
  std::vector<std::string> _outbox;
  std::atomic<bool> _closeRequested{false};
  std::jthread _thread;
};

// Factory creating WebSocketChannel instances for 'config'.
[[nodiscard]] ChannelFactory MakeWebSocketChannelFactory(TransportConfig config);

}  // namespace logwire
