#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "logwire/base-fd.hpp"
#include "logwire/counter-fd.hpp"
#include "logwire/socket.hpp"
#include "logwire/websocket-url.hpp"

namespace logwire::test {

// Minimal WebSocket server on the loopback interface, serving one client connection at a time.
// It performs the server side of the opening handshake and exchanges real (unmasked) frames.
class TestWebSocketServer {
 public:
  // Produces the text messages to answer one client text message with.
  using Responder = std::function<std::vector<std::string>(std::string_view text)>;

  TestWebSocketServer();

  TestWebSocketServer(const TestWebSocketServer&) = delete;
  TestWebSocketServer(TestWebSocketServer&&) = delete;
  TestWebSocketServer& operator=(const TestWebSocketServer&) = delete;
  TestWebSocketServer& operator=(TestWebSocketServer&&) = delete;

  ~TestWebSocketServer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // ws://127.0.0.1:<port><target>
  [[nodiscard]] std::string url(std::string_view target = websocket::kDefaultUploadPath) const;

  void setResponder(Responder responder);

  // Text message sent right after a successful upgrade.
  void setGreeting(std::string greeting);

  // Answer upgrade requests with '403 Forbidden'.
  void setRejectUpgrade(bool rejectUpgrade);

  // Sends a text message to the connected client.
  void sendText(std::string text);

  // Starts the close handshake with the connected client.
  void closeClient();

  // Next text message received from a client. Throws std::runtime_error after 'timeout'.
  std::string waitForMessage(std::chrono::milliseconds timeout);

  // Waits until the current client connection ended (whatever the reason).
  bool waitForDisconnect(std::chrono::milliseconds timeout);

  // Request targets of the accepted upgrades, in order.
  [[nodiscard]] std::vector<std::string> acceptedTargets() const;

 private:
  void run();
  void handleClient(BaseFd client);

  Socket _listen;
  uint16_t _port{0};
  WakeupFd _wakeFd;
  std::atomic_bool _stop{false};

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  Responder _responder;
  std::string _greeting;
  bool _rejectUpgrade{false};
  bool _clientConnected{false};
  std::deque<std::string> _received;
  std::vector<std::string> _acceptedTargets;
  std::vector<std::string> _outbox;
  bool _closeRequested{false};

  std::jthread _thread;
};

}  // namespace logwire::test
