#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "logwire/channel.hpp"
#include "logwire/counter-fd.hpp"
#include "logwire/protocol-message.hpp"
#include "logwire/transport-config.hpp"

namespace logwire {

enum class SessionState : uint8_t { Disconnected, Connecting, Connected };

std::string_view SessionStateName(SessionState state) noexcept;

using MessageHandler = std::function<void(const ProtocolMessage&)>;

// Calling it removes the handler it was returned for. Safe to call several times, and after the session died.
using Unsubscribe = std::function<void()>;

namespace detail {

// Handlers per message type, shared between the session and the unsubscribe functions it hands out.
class DispatchTable {
 public:
  uint64_t add(std::string_view type, MessageHandler handler);

  void remove(std::string_view type, uint64_t id);

  // Invokes every handler registered for msg.type. Returns the number of handlers called.
  std::size_t dispatch(const ProtocolMessage& msg) const;

 private:
  mutable std::mutex _mutex;
  std::map<std::string, std::vector<std::pair<uint64_t, MessageHandler>>, std::less<>> _handlers;
  uint64_t _nextId{0};
};

}  // namespace detail

// Captures the first inbound message whose type is one of the expected types, from its creation onwards.
// Obtained from TransportSession::expect() before sending the request it answers, so that a fast answer is
// never missed. Stops listening when destroyed.
class PendingMessage {
 public:
  PendingMessage(const PendingMessage&) = delete;
  PendingMessage(PendingMessage&&) noexcept = default;
  PendingMessage& operator=(const PendingMessage&) = delete;
  PendingMessage& operator=(PendingMessage&&) noexcept = default;

  ~PendingMessage();

  // Blocks until a matching message arrives. Throws ProtocolTimeoutError after 'timeout'.
  [[nodiscard]] ProtocolMessage wait(std::chrono::milliseconds timeout);

  // Non blocking check. The message stays available for a later wait().
  [[nodiscard]] std::optional<ProtocolMessage> tryGet() const;

  [[nodiscard]] const std::vector<std::string>& expectedTypes() const noexcept { return _types; }

 private:
  friend class TransportSession;

  struct State {
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::optional<ProtocolMessage> msg;
  };

  explicit PendingMessage(std::vector<std::string> types);

  std::vector<std::string> _types;
  std::shared_ptr<State> _state;
  std::vector<Unsubscribe> _unsubscribes;
};

// Owns one logical message channel to the upload service.
//
// connect() is idempotent and coalesces concurrent callers into a single attempt. Messages sent while not
// connected are queued and replayed in order once the channel opens. Inbound messages are dispatched by type
// to every registered handler, from the channel thread. There is no automatic reconnection: after a close,
// the next connect() opens a fresh channel.
//
// While connected, a 'ping' message is sent every keepAliveInterval. Inbound 'ping' messages are answered with
// 'pong' and inbound 'pong' messages are absorbed, neither reaches the handlers.
class TransportSession {
 public:
  // Session over real WebSocket channels. Throws std::invalid_argument if 'config' is invalid.
  explicit TransportSession(TransportConfig config);

  // Session over channels made by 'channelFactory'.
  TransportSession(TransportConfig config, ChannelFactory channelFactory);

  TransportSession(const TransportSession&) = delete;
  TransportSession(TransportSession&&) = delete;
  TransportSession& operator=(const TransportSession&) = delete;
  TransportSession& operator=(TransportSession&&) = delete;

  ~TransportSession();

  // Blocks until the channel is open. Throws ConnectionError if it could not be opened within connectTimeout.
  void connect();

  // Closes the channel. Outstanding waits are not interrupted, they fail at their own deadline.
  void disconnect();

  // Sends 'msg' immediately if connected, queues it otherwise.
  void send(const ProtocolMessage& msg);

  // Registers 'handler' for inbound messages of 'type'. Several handlers per type are allowed.
  Unsubscribe on(std::string_view type, MessageHandler handler);

  // Starts capturing the first inbound message of one of 'types'.
  [[nodiscard]] PendingMessage expect(std::vector<std::string> types);

  // Next inbound message of 'type' arriving after this call. Throws ProtocolTimeoutError after 'timeout'.
  [[nodiscard]] ProtocolMessage waitForMessage(std::string_view type, std::chrono::milliseconds timeout);

  [[nodiscard]] SessionState state() const;

  [[nodiscard]] bool isConnected() const { return state() == SessionState::Connected; }

  [[nodiscard]] std::size_t queuedMessagesCount() const;

  [[nodiscard]] const TransportConfig& config() const noexcept { return _config; }

 private:
  void onChannelOpen(uint64_t generation);
  void onChannelMessage(uint64_t generation, std::string_view text);
  void onChannelClose(uint64_t generation, std::string_view reason);

  // Requires _mutex to be held.
  void failConnectAttempt(std::string_view reason);

  void keepAliveLoop(const std::stop_token& stopToken);
  void runKeepAlive(const std::stop_token& stopToken);

  TransportConfig _config;
  ChannelFactory _channelFactory;
  std::shared_ptr<detail::DispatchTable> _dispatchTable;

  mutable std::mutex _mutex;
  std::unique_ptr<Channel> _channel;
  std::vector<std::string> _queue;
  std::promise<void> _connectPromise;
  std::shared_future<void> _connectFuture;
  uint64_t _generation{0};
  SessionState _state{SessionState::Disconnected};

  WakeupFd _keepAliveWakeFd;
  std::jthread _keepAliveThread;
};

}  // namespace logwire
