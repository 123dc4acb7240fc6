#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "logwire/channel.hpp"
#include "logwire/protocol-message.hpp"

namespace logwire::test {

// In-process stand-in for the upload service. Channels created by channelFactory() talk to it.
// Every channel callback is delivered from a single worker thread owned by the server, so that a reply is never
// delivered from inside Channel::send().
class FakeServer {
 public:
  enum class OpenBehavior : uint8_t {
    Accept,  // onOpen, then the 'connected' greeting
    Refuse,  // onClose
    Hang     // nothing, the client times out
  };

  // Produces the answers to one client message.
  using Responder = std::function<std::vector<ProtocolMessage>(const ProtocolMessage& request)>;

  FakeServer();

  FakeServer(const FakeServer&) = delete;
  FakeServer(FakeServer&&) = delete;
  FakeServer& operator=(const FakeServer&) = delete;
  FakeServer& operator=(FakeServer&&) = delete;

  ~FakeServer();

  [[nodiscard]] ChannelFactory channelFactory();

  void setOpenBehavior(OpenBehavior openBehavior);

  // Answer every client message of 'type' with what 'responder' returns. Replaces any previous responder.
  void respond(std::string_view type, Responder responder);

  // Send 'msg' to the currently open channel, if any.
  void push(const ProtocolMessage& msg);

  // Close the currently open channel from the server side.
  void dropConnection(std::string_view reason = "dropped by server");

  // Client messages received so far, in order (whatever the channel they came from).
  [[nodiscard]] std::vector<ProtocolMessage> received() const;

  [[nodiscard]] std::vector<ProtocolMessage> receivedOfType(std::string_view type) const;

  // Waits until at least 'count' client messages of 'type' have been received.
  bool waitForReceived(std::string_view type, std::size_t count, std::chrono::milliseconds timeout) const;

  [[nodiscard]] std::size_t channelsCreated() const;

  // Blocks until every task queued so far has been delivered.
  void drain();

  // Channel end point shared between a FakeChannel and the tasks delivering its callbacks.
  struct Endpoint;

 private:
  friend class FakeChannel;

  void post(std::function<void()> task);

  void onOpen(const std::shared_ptr<Endpoint>& endpoint);
  void onClientMessage(const std::shared_ptr<Endpoint>& endpoint, const std::string& text);
  void onClientClose(const std::shared_ptr<Endpoint>& endpoint);

  mutable std::mutex _mutex;
  mutable std::condition_variable _receivedCv;
  std::map<std::string, Responder, std::less<>> _responders;
  std::vector<ProtocolMessage> _received;
  std::shared_ptr<Endpoint> _current;
  std::size_t _channelsCreated{0};
  OpenBehavior _openBehavior{OpenBehavior::Accept};

  std::mutex _tasksMutex;
  std::condition_variable_any _tasksCv;
  std::condition_variable_any _idleCv;
  std::deque<std::function<void()>> _tasks;
  bool _busy{false};
  std::jthread _worker;
};

class FakeChannel final : public Channel {
 public:
  FakeChannel(FakeServer& server, std::shared_ptr<FakeServer::Endpoint> endpoint);

  FakeChannel(const FakeChannel&) = delete;
  FakeChannel(FakeChannel&&) = delete;
  FakeChannel& operator=(const FakeChannel&) = delete;
  FakeChannel& operator=(FakeChannel&&) = delete;

  // Waits for a callback in progress, no callback is delivered afterwards.
  ~FakeChannel() override;

  void open(Callbacks callbacks) override;

  void send(std::string text) override;

  void close() override;

 private:
  FakeServer& _server;
  std::shared_ptr<FakeServer::Endpoint> _endpoint;
};

}  // namespace logwire::test
