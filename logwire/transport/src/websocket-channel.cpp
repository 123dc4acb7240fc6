#include "logwire/websocket-channel.hpp"

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "logwire/base-fd.hpp"
#include "logwire/event-loop.hpp"
#include "logwire/event.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/tcp-connector.hpp"
#include "logwire/transport-config.hpp"
#include "logwire/transport.hpp"
#include "logwire/websocket-constants.hpp"
#include "logwire/websocket-handler.hpp"
#include "logwire/websocket-upgrade.hpp"
#include "logwire/websocket-url.hpp"

namespace logwire {

namespace {

constexpr std::size_t kReadChunkSize = 16UL * 1024UL;
constexpr std::size_t kMaxUpgradeResponseSize = 16UL * 1024UL;
constexpr auto kClosingPollPeriod = std::chrono::milliseconds{50};

std::string_view AsChars(std::span<const std::byte> data) {
  return {reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace

// State of one connection attempt, only ever touched by the I/O thread.
class WebSocketChannel::Connection {
 public:
  explicit Connection(WebSocketChannel& channel)
      : _channel(channel),
        _handler(websocket::WebSocketConfig{.maxMessageSize = channel._maxMessageSize},
                 websocket::WebSocketCallbacks{
                     .onMessage =
                         [this](std::span<const std::byte> payload, bool isBinary) {
                           if (isBinary) {
                             log::warn("Ignoring binary message of {} bytes from {}", payload.size(),
                                       _channel._url.authority());
                             return;
                           }
                           if (_channel._callbacks.onMessage) {
                             _channel._callbacks.onMessage(AsChars(payload));
                           }
                         },
                     .onPing = {},
                     .onPong = {},
                     .onClose =
                         [this](websocket::CloseCode code, std::string_view reason) {
                           _closeReason = fmt::format("Closed by peer (code {}{}{})", static_cast<int>(code),
                                                      reason.empty() ? "" : ": ", reason);
                         },
                     .onError =
                         [this](websocket::CloseCode code, std::string_view message) {
                           _closeReason =
                               fmt::format("WebSocket protocol error (code {}): {}", static_cast<int>(code), message);
                         }}) {}

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  ~Connection() {
    if (_transport && _phase != Phase::TlsHandshake) {
      _transport->shutdown();
    }
  }

  // Returns the reason the connection ended.
  std::string run(const std::stop_token& stopToken);

 private:
  enum class Phase : uint8_t { TcpConnecting, TlsHandshake, Upgrading, Open, Closing };

  // Each of these returns a close reason when the connection is over.
  std::optional<std::string> startTransport();
  std::optional<std::string> driveTlsHandshake();
  std::optional<std::string> onSocketEvent(EventBmp events);
  std::optional<std::string> readUpgradeResponse();
  std::optional<std::string> readFrames();
  std::optional<std::string> flushOutput();

  void startUpgrade();
  void drainOutbox();
  void updateInterest();

  WebSocketChannel& _channel;
  EventLoop _loop;
  BaseFd _fd;
  std::unique_ptr<ITransport> _transport;
  websocket::WebSocketHandler _handler;
  std::string _key;
  std::string _rawOutput;
  std::string _upgradeBuffer;
  std::string _closeReason{"Connection closed"};
  EventBmp _interest{0};
  TransportHint _lastWriteHint{TransportHint::None};
  Phase _phase{Phase::TcpConnecting};
};

std::string WebSocketChannel::Connection::run(const std::stop_token& stopToken) {
  const auto& url = _channel._url;
  auto connectResult = ConnectTCP(url.host, url.port);
  if (connectResult.failure) {
    return fmt::format("Unable to connect to {}", url.authority());
  }
  _fd = std::move(connectResult.fd);
  _interest = EventIn | EventOut | EventRdHup;
  _loop.addOrThrow(EventLoop::EventFd{_interest, _fd.fd()});
  _loop.addOrThrow(EventLoop::EventFd{EventIn, _channel._wakeFd.fd()});

  if (!connectResult.connectPending) {
    if (auto reason = startTransport()) {
      return *reason;
    }
  }

  while (true) {
    if (_channel.closeRequested(stopToken)) {
      if (_phase != Phase::Open && _phase != Phase::Closing) {
        return "Channel closed before it opened";
      }
      if (_phase == Phase::Open) {
        log::debug("Closing WebSocket connection to {}", url.authority());
        _handler.sendClose(websocket::CloseCode::Normal);
        _phase = Phase::Closing;
        _closeReason = "Closed by client";
      }
    }
    if (_phase == Phase::Open) {
      drainOutbox();
    }
    if (auto reason = flushOutput()) {
      return *reason;
    }
    if (_phase == Phase::Closing) {
      if (_handler.isCloseComplete() && !_handler.hasPendingOutput()) {
        return _closeReason;
      }
      if (_handler.hasCloseTimedOut()) {
        log::warn("No close answer from {} within {} ms", url.authority(), _handler.config().closeTimeout.count());
        return _closeReason;
      }
    }
    updateInterest();

    const SysDuration timeout = _phase == Phase::Closing ? SysDuration{kClosingPollPeriod} : SysDuration{-1};
    for (const auto& event : _loop.poll(timeout)) {
      if (event.fd == _channel._wakeFd.fd()) {
        _channel._wakeFd.consume();
        continue;
      }
      if (auto reason = onSocketEvent(event.eventBmp)) {
        return *reason;
      }
    }
  }
}

std::optional<std::string> WebSocketChannel::Connection::onSocketEvent(EventBmp events) {
  switch (_phase) {
    case Phase::TcpConnecting: {
      const int err = PendingConnectError(_fd.fd());
      if (err != 0) {
        return fmt::format("Unable to connect to {}: {}", _channel._url.authority(), std::strerror(err));
      }
      if ((events & (EventOut | EventErr | EventHup)) == 0) {
        return std::nullopt;
      }
      return startTransport();
    }
    case Phase::TlsHandshake:
      return driveTlsHandshake();
    case Phase::Upgrading:
      if ((events & (EventIn | EventRdHup | EventHup | EventErr)) != 0) {
        return readUpgradeResponse();
      }
      return std::nullopt;
    case Phase::Open:
      [[fallthrough]];
    case Phase::Closing:
      if ((events & (EventIn | EventRdHup | EventHup | EventErr)) != 0) {
        return readFrames();
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

std::optional<std::string> WebSocketChannel::Connection::startTransport() {
  log::debug("TCP connection to {} established", _channel._url.authority());
#ifdef LOGWIRE_ENABLE_OPENSSL
  if (_channel._tlsContext) {
    _transport = _channel._tlsContext->createTransport(_fd.fd(), _channel._url.host);
    _phase = Phase::TlsHandshake;
    return driveTlsHandshake();
  }
#endif
  _transport = std::make_unique<PlainTransport>(_fd.fd());
  startUpgrade();
  return std::nullopt;
}

std::optional<std::string> WebSocketChannel::Connection::driveTlsHandshake() {
  const auto hint = _transport->handshake();
  switch (hint) {
    case TransportHint::None:
      log::debug("TLS handshake with {} done", _channel._url.authority());
      startUpgrade();
      return std::nullopt;
    case TransportHint::Error:
      return fmt::format("TLS handshake with {} failed", _channel._url.authority());
    default:
      _lastWriteHint = hint;
      return std::nullopt;
  }
}

void WebSocketChannel::Connection::startUpgrade() {
  _key = websocket::GenerateWebSocketKey();
  _rawOutput = websocket::BuildUpgradeRequest(_channel._url.authority(), _channel._url.target, _key);
  _lastWriteHint = TransportHint::None;
  _phase = Phase::Upgrading;
}

std::optional<std::string> WebSocketChannel::Connection::readUpgradeResponse() {
  char buf[kReadChunkSize];
  while (true) {
    const auto [nbRead, want] = _transport->read(buf, sizeof(buf));
    if (want == TransportHint::Error) {
      return fmt::format("Read error during WebSocket upgrade with {}", _channel._url.authority());
    }
    if (nbRead == 0) {
      if (want == TransportHint::None) {
        return fmt::format("Connection closed by {} during WebSocket upgrade", _channel._url.authority());
      }
      return std::nullopt;
    }
    _upgradeBuffer.append(buf, nbRead);

    const auto response = websocket::ParseUpgradeResponse(_upgradeBuffer, _key);
    switch (response.status) {
      case websocket::UpgradeResponse::Status::Incomplete:
        if (_upgradeBuffer.size() > kMaxUpgradeResponseSize) {
          return fmt::format("WebSocket upgrade response from {} is too large", _channel._url.authority());
        }
        continue;
      case websocket::UpgradeResponse::Status::Rejected:
        return fmt::format("WebSocket upgrade rejected by {} (status {}): {}", _channel._url.authority(),
                           response.statusCode, response.errorMessage);
      case websocket::UpgradeResponse::Status::Accepted: {
        log::info("WebSocket connection to {}{} open", _channel._url.authority(), _channel._url.target);
        _phase = Phase::Open;
        const std::string leftover = _upgradeBuffer.substr(response.headSize);
        _upgradeBuffer.clear();
        _upgradeBuffer.shrink_to_fit();
        if (_channel._callbacks.onOpen) {
          _channel._callbacks.onOpen();
        }
        if (!leftover.empty() &&
            _handler.processInput(std::as_bytes(std::span<const char>(leftover))) ==
                websocket::WebSocketHandler::Action::Close) {
          _phase = Phase::Closing;
        }
        // The transport may hold more buffered bytes than epoll reports.
        return _phase == Phase::Open ? readFrames() : std::nullopt;
      }
      default:
        return std::nullopt;
    }
  }
}

std::optional<std::string> WebSocketChannel::Connection::readFrames() {
  char buf[kReadChunkSize];
  while (true) {
    const auto [nbRead, want] = _transport->read(buf, sizeof(buf));
    if (want == TransportHint::Error) {
      return fmt::format("Read error on connection with {}", _channel._url.authority());
    }
    if (nbRead == 0) {
      if (want == TransportHint::None) {
        if (_phase == Phase::Closing) {
          return _closeReason;
        }
        return fmt::format("Connection closed by {}", _channel._url.authority());
      }
      return std::nullopt;
    }
    const auto action = _handler.processInput(std::as_bytes(std::span<const char>(buf, nbRead)));
    if (action == websocket::WebSocketHandler::Action::Close) {
      _phase = Phase::Closing;
    }
  }
}

void WebSocketChannel::Connection::drainOutbox() {
  std::vector<std::string> outbox;
  {
    std::scoped_lock lock(_channel._outboxMutex);
    outbox.swap(_channel._outbox);
  }
  for (const auto& text : outbox) {
    if (!_handler.sendText(text)) {
      log::warn("Dropping message of {} bytes, connection is closing", text.size());
    }
  }
}

std::optional<std::string> WebSocketChannel::Connection::flushOutput() {
  if (!_transport || _phase == Phase::TlsHandshake) {
    return std::nullopt;
  }
  _lastWriteHint = TransportHint::None;
  while (!_rawOutput.empty()) {
    const auto [nbWritten, want] = _transport->write(_rawOutput);
    _rawOutput.erase(0, nbWritten);
    if (want == TransportHint::Error) {
      return fmt::format("Write error on connection with {}", _channel._url.authority());
    }
    if (want != TransportHint::None) {
      _lastWriteHint = want;
      return std::nullopt;
    }
  }
  while (_handler.hasPendingOutput()) {
    const auto [nbWritten, want] = _transport->write(AsChars(_handler.getPendingOutput()));
    _handler.onOutputWritten(nbWritten);
    if (want == TransportHint::Error) {
      return fmt::format("Write error on connection with {}", _channel._url.authority());
    }
    if (want != TransportHint::None) {
      _lastWriteHint = want;
      break;
    }
  }
  return std::nullopt;
}

void WebSocketChannel::Connection::updateInterest() {
  EventBmp interest = EventIn | EventRdHup;
  if (_phase == Phase::TcpConnecting || _lastWriteHint == TransportHint::WriteReady) {
    interest |= EventOut;
  }
  if (interest != _interest && _loop.mod(EventLoop::EventFd{interest, _fd.fd()})) {
    _interest = interest;
  }
}

WebSocketChannel::WebSocketChannel(const TransportConfig& config)
    : _url((config.validate(), websocket::WebSocketUrl::Parse(config.url))), _maxMessageSize(config.maxMessageSize) {
#ifdef LOGWIRE_ENABLE_OPENSSL
  if (_url.secure) {
    _tlsContext = std::make_unique<TlsClientContext>(
        TlsClientConfig{.verifyPeer = config.tlsVerifyPeer, .caFile = config.tlsCaFile, .caPem = {}});
  }
#endif
}

WebSocketChannel::~WebSocketChannel() {
  _thread.request_stop();
  _wakeFd.notify();
}

void WebSocketChannel::open(Callbacks callbacks) {
  if (_thread.joinable()) {
    throw std::logic_error("A WebSocketChannel can only be opened once");
  }
  _callbacks = std::move(callbacks);
  _thread = std::jthread([this](const std::stop_token& stopToken) { run(stopToken); });
}

void WebSocketChannel::send(std::string text) {
  {
    std::scoped_lock lock(_outboxMutex);
    _outbox.push_back(std::move(text));
  }
  _wakeFd.notify();
}

void WebSocketChannel::close() {
  _closeRequested.store(true, std::memory_order_release);
  _wakeFd.notify();
}

void WebSocketChannel::run(const std::stop_token& stopToken) {
  std::string reason;
  try {
    Connection connection(*this);
    reason = connection.run(stopToken);
  } catch (const std::exception& ex) {
    log::error("WebSocket channel to {} failed: {}", _url.authority(), ex.what());
    reason = ex.what();
  }
  log::info("WebSocket channel to {} closed: {}", _url.authority(), reason);
  if (_callbacks.onClose) {
    _callbacks.onClose(reason);
  }
}

ChannelFactory MakeWebSocketChannelFactory(TransportConfig config) {
  return [config = std::move(config)]() -> std::unique_ptr<Channel> {
    return std::make_unique<WebSocketChannel>(config);
  };
}

}  // namespace logwire
