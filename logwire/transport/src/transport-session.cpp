#include "logwire/transport-session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "logwire/counter-fd.hpp"
#include "logwire/event-loop.hpp"
#include "logwire/event.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/protocol-message.hpp"
#include "logwire/timedef.hpp"
#include "logwire/transport-errors.hpp"
#include "logwire/websocket-channel.hpp"

namespace logwire {

std::string_view SessionStateName(SessionState state) noexcept {
  switch (state) {
    case SessionState::Disconnected:
      return "Disconnected";
    case SessionState::Connecting:
      return "Connecting";
    case SessionState::Connected:
      return "Connected";
    default:
      return "Unknown";
  }
}

namespace detail {

uint64_t DispatchTable::add(std::string_view type, MessageHandler handler) {
  std::scoped_lock lock(_mutex);
  const uint64_t id = _nextId++;
  auto it = _handlers.find(type);
  if (it == _handlers.end()) {
    it = _handlers.emplace(std::string(type), std::vector<std::pair<uint64_t, MessageHandler>>{}).first;
  }
  it->second.emplace_back(id, std::move(handler));
  return id;
}

void DispatchTable::remove(std::string_view type, uint64_t id) {
  std::scoped_lock lock(_mutex);
  auto it = _handlers.find(type);
  if (it == _handlers.end()) {
    return;
  }
  std::erase_if(it->second, [id](const auto& idAndHandler) { return idAndHandler.first == id; });
  if (it->second.empty()) {
    _handlers.erase(it);
  }
}

std::size_t DispatchTable::dispatch(const ProtocolMessage& msg) const {
  // Handlers are called without the lock so that they can register or unregister handlers themselves.
  std::vector<MessageHandler> handlers;
  {
    std::scoped_lock lock(_mutex);
    auto it = _handlers.find(msg.type);
    if (it == _handlers.end()) {
      return 0;
    }
    handlers.reserve(it->second.size());
    for (const auto& [id, handler] : it->second) {
      handlers.push_back(handler);
    }
  }
  for (const auto& handler : handlers) {
    try {
      handler(msg);
    } catch (const std::exception& ex) {
      log::error("Handler for message '{}' threw: {}", msg.type, ex.what());
    }
  }
  return handlers.size();
}

}  // namespace detail

PendingMessage::PendingMessage(std::vector<std::string> types)
    : _types(std::move(types)), _state(std::make_shared<State>()) {}

PendingMessage::~PendingMessage() {
  for (auto& unsubscribe : _unsubscribes) {
    unsubscribe();
  }
}

ProtocolMessage PendingMessage::wait(std::chrono::milliseconds timeout) {
  std::unique_lock lock(_state->mutex);
  if (!_state->cv.wait_for(lock, timeout, [this] { return _state->msg.has_value(); })) {
    throw ProtocolTimeoutError(
        fmt::format("No '{}' message received within {} ms", fmt::join(_types, "' or '"), timeout.count()), _types);
  }
  return *_state->msg;
}

std::optional<ProtocolMessage> PendingMessage::tryGet() const {
  std::scoped_lock lock(_state->mutex);
  return _state->msg;
}

TransportSession::TransportSession(TransportConfig config)
    : TransportSession(config, MakeWebSocketChannelFactory(config)) {}

TransportSession::TransportSession(TransportConfig config, ChannelFactory channelFactory)
    : _config(std::move(config)),
      _channelFactory(std::move(channelFactory)),
      _dispatchTable(std::make_shared<detail::DispatchTable>()) {
  _config.validate();
  if (!_channelFactory) {
    throw std::invalid_argument("TransportSession requires a channel factory");
  }
  if (_config.keepAliveInterval > std::chrono::milliseconds{0}) {
    _keepAliveThread = std::jthread([this](const std::stop_token& stopToken) { keepAliveLoop(stopToken); });
  }
}

TransportSession::~TransportSession() {
  if (_keepAliveThread.joinable()) {
    _keepAliveThread.request_stop();
    _keepAliveWakeFd.notify();
    _keepAliveThread.join();
  }
  std::unique_ptr<Channel> channel;
  {
    std::scoped_lock lock(_mutex);
    failConnectAttempt("Session destroyed");
    ++_generation;
    _state = SessionState::Disconnected;
    channel = std::move(_channel);
  }
  if (channel) {
    channel->close();
  }
  // 'channel' is destroyed here, after its callbacks can no longer find a matching generation.
}

void TransportSession::connect() {
  // A replaced channel is destroyed outside of the lock as its destructor waits for its thread,
  // which may be blocked in one of our callbacks.
  std::unique_ptr<Channel> retiredChannel;
  std::unique_ptr<Channel> failedChannel;
  std::optional<std::string> failure;
  std::shared_future<void> connectFuture;
  uint64_t generation;
  {
    std::scoped_lock lock(_mutex);
    if (_state == SessionState::Connected) {
      return;
    }
    if (_state == SessionState::Disconnected) {
      retiredChannel = std::move(_channel);
      ++_generation;
      _connectPromise = std::promise<void>();
      _connectFuture = _connectPromise.get_future().share();
      _state = SessionState::Connecting;
      log::info("Connecting to {}", _config.url);
      try {
        _channel = _channelFactory();
        const uint64_t attempt = _generation;
        _channel->open(Channel::Callbacks{
            .onOpen = [this, attempt]() { onChannelOpen(attempt); },
            .onMessage = [this, attempt](std::string_view text) { onChannelMessage(attempt, text); },
            .onClose = [this, attempt](std::string_view reason) { onChannelClose(attempt, reason); }});
      } catch (const std::exception& ex) {
        failConnectAttempt(ex.what());
        ++_generation;
        _state = SessionState::Disconnected;
        failedChannel = std::move(_channel);
        failure = ex.what();
      }
    }
    connectFuture = _connectFuture;
    generation = _generation;
  }
  if (retiredChannel) {
    retiredChannel->close();
    retiredChannel.reset();
  }
  if (failure) {
    failedChannel.reset();
    throw ConnectionError(fmt::format("Unable to open a channel to {}: {}", _config.url, *failure));
  }

  if (connectFuture.wait_for(_config.connectTimeout) == std::future_status::timeout) {
    std::scoped_lock lock(_mutex);
    if (_state == SessionState::Connecting && _generation == generation) {
      failConnectAttempt(fmt::format("Connection timeout after {} ms", _config.connectTimeout.count()));
      ++_generation;
      _state = SessionState::Disconnected;
      if (_channel) {
        _channel->close();
      }
    }
  }
  try {
    connectFuture.get();
  } catch (const ConnectionError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ConnectionError(ex.what());
  }
}

void TransportSession::disconnect() {
  std::scoped_lock lock(_mutex);
  failConnectAttempt("Disconnected by client");
  if (_channel) {
    _channel->close();
  }
  if (_state != SessionState::Disconnected) {
    log::info("Disconnecting from {}", _config.url);
  }
  ++_generation;
  _state = SessionState::Disconnected;
}

void TransportSession::send(const ProtocolMessage& msg) {
  std::string text = SerializeMessage(msg);
  std::scoped_lock lock(_mutex);
  if (_state == SessionState::Connected) {
    log::debug("Sending '{}' ({} bytes)", msg.type, text.size());
    _channel->send(std::move(text));
  } else {
    log::debug("Queueing '{}' ({} bytes) until connected", msg.type, text.size());
    _queue.push_back(std::move(text));
  }
}

Unsubscribe TransportSession::on(std::string_view type, MessageHandler handler) {
  const uint64_t id = _dispatchTable->add(type, std::move(handler));
  return [weakTable = std::weak_ptr<detail::DispatchTable>(_dispatchTable), type = std::string(type), id]() {
    if (auto table = weakTable.lock()) {
      table->remove(type, id);
    }
  };
}

PendingMessage TransportSession::expect(std::vector<std::string> types) {
  PendingMessage pending(std::move(types));
  pending._unsubscribes.reserve(pending._types.size());
  for (const auto& type : pending._types) {
    pending._unsubscribes.push_back(on(type, [state = pending._state](const ProtocolMessage& msg) {
      std::scoped_lock lock(state->mutex);
      if (!state->msg) {
        state->msg = msg;
        state->cv.notify_all();
      }
    }));
  }
  return pending;
}

ProtocolMessage TransportSession::waitForMessage(std::string_view type, std::chrono::milliseconds timeout) {
  return expect({std::string(type)}).wait(timeout);
}

SessionState TransportSession::state() const {
  std::scoped_lock lock(_mutex);
  return _state;
}

std::size_t TransportSession::queuedMessagesCount() const {
  std::scoped_lock lock(_mutex);
  return _queue.size();
}

void TransportSession::onChannelOpen(uint64_t generation) {
  std::scoped_lock lock(_mutex);
  if (generation != _generation || _state != SessionState::Connecting) {
    return;
  }
  _state = SessionState::Connected;
  log::info("Connected to {}, replaying {} queued message(s)", _config.url, _queue.size());
  for (auto& text : _queue) {
    _channel->send(std::move(text));
  }
  _queue.clear();
  _connectPromise.set_value();
}

void TransportSession::onChannelMessage(uint64_t generation, std::string_view text) {
  {
    std::scoped_lock lock(_mutex);
    if (generation != _generation) {
      return;
    }
  }
  ProtocolMessage msg;
  try {
    msg = ParseMessage(text);
  } catch (const std::invalid_argument& ex) {
    log::warn("Ignoring unparsable message: {}", ex.what());
    return;
  }
  if (msg.type == msgtype::kPing) {
    log::trace("Answering ping");
    send(MakeMessage(msgtype::kPong));
    return;
  }
  if (msg.type == msgtype::kPong) {
    log::trace("Received pong");
    return;
  }
  if (_dispatchTable->dispatch(msg) == 0) {
    log::debug("No handler for message '{}'", msg.type);
  }
}

void TransportSession::onChannelClose(uint64_t generation, std::string_view reason) {
  std::scoped_lock lock(_mutex);
  if (generation != _generation) {
    return;
  }
  failConnectAttempt(reason);
  if (_state == SessionState::Connected) {
    log::warn("Connection to {} lost: {}", _config.url, reason);
  }
  _state = SessionState::Disconnected;
}

void TransportSession::failConnectAttempt(std::string_view reason) {
  if (_state != SessionState::Connecting) {
    return;
  }
  log::error("Unable to connect to {}: {}", _config.url, reason);
  _connectPromise.set_exception(std::make_exception_ptr(ConnectionError(std::string(reason))));
}

void TransportSession::keepAliveLoop(const std::stop_token& stopToken) {
  try {
    runKeepAlive(stopToken);
  } catch (const std::exception& ex) {
    log::error("Keepalive stopped: {}", ex.what());
  }
}

void TransportSession::runKeepAlive(const std::stop_token& stopToken) {
  EventLoop loop;
  TickerFd ticker(_config.keepAliveInterval);
  loop.addOrThrow(EventLoop::EventFd{EventIn, ticker.fd()});
  loop.addOrThrow(EventLoop::EventFd{EventIn, _keepAliveWakeFd.fd()});
  while (!stopToken.stop_requested()) {
    for (const auto& event : loop.poll(SysDuration{-1})) {
      if (event.fd == _keepAliveWakeFd.fd()) {
        _keepAliveWakeFd.consume();
      } else if (ticker.consume() != 0 && !stopToken.stop_requested() && isConnected()) {
        log::trace("Sending keepalive ping");
        send(MakeMessage(msgtype::kPing));
      }
    }
  }
}

}  // namespace logwire
