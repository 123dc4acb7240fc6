#include "logwire/test-websocket-server.hpp"

#include <poll.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "logwire/base-fd.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/transport.hpp"
#include "logwire/websocket-handler.hpp"
#include "logwire/websocket-upgrade.hpp"

namespace logwire::test {

namespace {

constexpr int kPollMs = 25;
constexpr std::size_t kMaxRequestHeadSize = 16UL * 1024UL;

// Writes as much as possible of 'data', returns the number of bytes written or nullopt on error.
std::optional<std::size_t> WriteSome(PlainTransport& transport, std::string_view data) {
  const auto [nbWritten, want] = transport.write(data);
  if (want == TransportHint::Error) {
    return std::nullopt;
  }
  return nbWritten;
}

}  // namespace

TestWebSocketServer::TestWebSocketServer() {
  _listen.bindAndListen(_port);
  _thread = std::jthread([this] { run(); });
}

TestWebSocketServer::~TestWebSocketServer() {
  _stop.store(true);
  _wakeFd.notify();
}

std::string TestWebSocketServer::url(std::string_view target) const {
  return fmt::format("ws://127.0.0.1:{}{}", _port, target);
}

void TestWebSocketServer::setResponder(Responder responder) {
  std::scoped_lock lock(_mutex);
  _responder = std::move(responder);
}

void TestWebSocketServer::setGreeting(std::string greeting) {
  std::scoped_lock lock(_mutex);
  _greeting = std::move(greeting);
}

void TestWebSocketServer::setRejectUpgrade(bool rejectUpgrade) {
  std::scoped_lock lock(_mutex);
  _rejectUpgrade = rejectUpgrade;
}

void TestWebSocketServer::sendText(std::string text) {
  {
    std::scoped_lock lock(_mutex);
    _outbox.push_back(std::move(text));
  }
  _wakeFd.notify();
}

void TestWebSocketServer::closeClient() {
  {
    std::scoped_lock lock(_mutex);
    _closeRequested = true;
  }
  _wakeFd.notify();
}

std::string TestWebSocketServer::waitForMessage(std::chrono::milliseconds timeout) {
  std::unique_lock lock(_mutex);
  if (!_cv.wait_for(lock, timeout, [this] { return !_received.empty(); })) {
    throw std::runtime_error("No WebSocket message received in time");
  }
  std::string text = std::move(_received.front());
  _received.pop_front();
  return text;
}

bool TestWebSocketServer::waitForDisconnect(std::chrono::milliseconds timeout) {
  std::unique_lock lock(_mutex);
  return _cv.wait_for(lock, timeout, [this] { return !_clientConnected; });
}

std::vector<std::string> TestWebSocketServer::acceptedTargets() const {
  std::scoped_lock lock(_mutex);
  return _acceptedTargets;
}

void TestWebSocketServer::run() {
  while (!_stop.load()) {
    std::array<pollfd, 2> pfds{pollfd{_listen.fd(), POLLIN, 0}, pollfd{_wakeFd.fd(), POLLIN, 0}};
    if (::poll(pfds.data(), pfds.size(), kPollMs) <= 0) {
      continue;
    }
    if ((pfds[1].revents & POLLIN) != 0) {
      _wakeFd.consume();
    }
    if ((pfds[0].revents & POLLIN) == 0) {
      continue;
    }
    BaseFd client = _listen.accept();
    if (!client) {
      continue;
    }
    {
      std::scoped_lock lock(_mutex);
      _clientConnected = true;
      _closeRequested = false;
    }
    try {
      handleClient(std::move(client));
    } catch (const std::exception& ex) {
      log::error("TestWebSocketServer client failed: {}", ex.what());
    }
    {
      std::scoped_lock lock(_mutex);
      _clientConnected = false;
    }
    _cv.notify_all();
  }
}

void TestWebSocketServer::handleClient(BaseFd client) {
  PlainTransport transport(client.fd());
  std::string head;
  std::string rawOutput;
  bool upgraded = false;
  bool closeAfterRawOutput = false;

  websocket::WebSocketHandler handler(websocket::WebSocketConfig{.isServerSide = true});
  handler.setCallbacks(websocket::WebSocketCallbacks{
      .onMessage =
          [this, &handler](std::span<const std::byte> payload, bool isBinary) {
            if (isBinary) {
              return;
            }
            std::string text(reinterpret_cast<const char*>(payload.data()), payload.size());
            Responder responder;
            {
              std::scoped_lock lock(_mutex);
              _received.push_back(text);
              responder = _responder;
            }
            _cv.notify_all();
            if (responder) {
              for (const auto& reply : responder(text)) {
                handler.sendText(reply);
              }
            }
          },
      .onPing = {},
      .onPong = {},
      .onClose = {},
      .onError = {}});

  while (!_stop.load()) {
    // Flush
    if (!rawOutput.empty()) {
      const auto nbWritten = WriteSome(transport, rawOutput);
      if (!nbWritten) {
        return;
      }
      rawOutput.erase(0, *nbWritten);
      if (rawOutput.empty() && closeAfterRawOutput) {
        return;
      }
    }
    while (rawOutput.empty() && handler.hasPendingOutput()) {
      const auto pending = handler.getPendingOutput();
      const auto nbWritten =
          WriteSome(transport, std::string_view(reinterpret_cast<const char*>(pending.data()), pending.size()));
      if (!nbWritten) {
        return;
      }
      handler.onOutputWritten(*nbWritten);
      if (*nbWritten == 0) {
        break;
      }
    }
    if (handler.isCloseComplete() && !handler.hasPendingOutput()) {
      transport.shutdown();
      return;
    }

    const bool wantWrite = !rawOutput.empty() || handler.hasPendingOutput();
    std::array<pollfd, 2> pfds{pollfd{client.fd(), static_cast<short>(POLLIN | (wantWrite ? POLLOUT : 0)), 0},
                               pollfd{_wakeFd.fd(), POLLIN, 0}};
    if (::poll(pfds.data(), pfds.size(), kPollMs) < 0) {
      continue;
    }
    if ((pfds[1].revents & POLLIN) != 0) {
      _wakeFd.consume();
    }
    if (upgraded) {
      std::vector<std::string> outbox;
      bool closeRequested;
      {
        std::scoped_lock lock(_mutex);
        outbox.swap(_outbox);
        closeRequested = std::exchange(_closeRequested, false);
      }
      for (const auto& text : outbox) {
        handler.sendText(text);
      }
      if (closeRequested) {
        handler.sendClose(websocket::CloseCode::GoingAway, "server shutdown");
      }
    }
    if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
      continue;
    }

    char buf[4096];
    const auto [nbRead, want] = transport.read(buf, sizeof(buf));
    if (want == TransportHint::Error || (nbRead == 0 && want == TransportHint::None)) {
      return;
    }
    if (nbRead == 0) {
      continue;
    }
    if (upgraded) {
      (void)handler.processInput(std::as_bytes(std::span<const char>(buf, nbRead)));
      continue;
    }

    head.append(buf, nbRead);
    const auto request = websocket::ParseUpgradeRequest(head);
    if (request.status == websocket::UpgradeRequest::Status::Incomplete) {
      if (head.size() > kMaxRequestHeadSize) {
        return;
      }
      continue;
    }
    bool reject;
    std::string greeting;
    {
      std::scoped_lock lock(_mutex);
      reject = _rejectUpgrade;
      greeting = _greeting;
    }
    if (request.status == websocket::UpgradeRequest::Status::Invalid) {
      rawOutput = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
      closeAfterRawOutput = true;
      continue;
    }
    if (reject) {
      rawOutput = "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
      closeAfterRawOutput = true;
      continue;
    }
    rawOutput = websocket::BuildUpgradeResponse(request.key);
    {
      std::scoped_lock lock(_mutex);
      _acceptedTargets.emplace_back(request.target);
    }
    upgraded = true;
    if (!greeting.empty()) {
      handler.sendText(greeting);
    }
    if (head.size() > request.headSize) {
      const std::string leftover = head.substr(request.headSize);
      (void)handler.processInput(std::as_bytes(std::span<const char>(leftover)));
    }
    head.clear();
  }
}

}  // namespace logwire::test
