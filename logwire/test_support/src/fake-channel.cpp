#include "logwire/fake-channel.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "logwire/channel.hpp"
#include "logwire/log.hpp"
#include "logwire/protocol-message.hpp"

namespace logwire::test {

struct FakeServer::Endpoint {
  // Held while a callback runs.
  std::mutex callbackMutex;
  Channel::Callbacks callbacks;
  bool closed{false};
};

namespace {

void DeliverOpen(FakeServer::Endpoint& endpoint) {
  std::scoped_lock lock(endpoint.callbackMutex);
  if (!endpoint.closed && endpoint.callbacks.onOpen) {
    endpoint.callbacks.onOpen();
  }
}

void DeliverMessage(FakeServer::Endpoint& endpoint, std::string_view text) {
  std::scoped_lock lock(endpoint.callbackMutex);
  if (!endpoint.closed && endpoint.callbacks.onMessage) {
    endpoint.callbacks.onMessage(text);
  }
}

void DeliverClose(FakeServer::Endpoint& endpoint, std::string_view reason) {
  std::scoped_lock lock(endpoint.callbackMutex);
  if (endpoint.closed) {
    return;
  }
  endpoint.closed = true;
  if (endpoint.callbacks.onClose) {
    endpoint.callbacks.onClose(reason);
  }
}

bool IsClosed(FakeServer::Endpoint& endpoint) {
  std::scoped_lock lock(endpoint.callbackMutex);
  return endpoint.closed;
}

}  // namespace

FakeServer::FakeServer() {
  _worker = std::jthread([this](const std::stop_token& stopToken) {
    while (true) {
      std::function<void()> task;
      {
        std::unique_lock lock(_tasksMutex);
        if (!_tasksCv.wait(lock, stopToken, [this] { return !_tasks.empty(); })) {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop_front();
        _busy = true;
      }
      try {
        task();
      } catch (const std::exception& ex) {
        log::error("FakeServer task failed: {}", ex.what());
      }
      {
        std::scoped_lock lock(_tasksMutex);
        _busy = false;
      }
      _idleCv.notify_all();
    }
  });
}

FakeServer::~FakeServer() {
  _worker.request_stop();
  _worker.join();
}

ChannelFactory FakeServer::channelFactory() {
  return [this]() -> std::unique_ptr<Channel> {
    {
      std::scoped_lock lock(_mutex);
      ++_channelsCreated;
    }
    return std::make_unique<FakeChannel>(*this, std::make_shared<Endpoint>());
  };
}

void FakeServer::setOpenBehavior(OpenBehavior openBehavior) {
  std::scoped_lock lock(_mutex);
  _openBehavior = openBehavior;
}

void FakeServer::respond(std::string_view type, Responder responder) {
  std::scoped_lock lock(_mutex);
  _responders.insert_or_assign(std::string(type), std::move(responder));
}

void FakeServer::push(const ProtocolMessage& msg) {
  post([this, text = SerializeMessage(msg)]() {
    std::shared_ptr<Endpoint> endpoint;
    {
      std::scoped_lock lock(_mutex);
      endpoint = _current;
    }
    if (endpoint) {
      DeliverMessage(*endpoint, text);
    }
  });
}

void FakeServer::dropConnection(std::string_view reason) {
  post([this, reason = std::string(reason)]() {
    std::shared_ptr<Endpoint> endpoint;
    {
      std::scoped_lock lock(_mutex);
      endpoint = std::move(_current);
    }
    if (endpoint) {
      DeliverClose(*endpoint, reason);
    }
  });
}

std::vector<ProtocolMessage> FakeServer::received() const {
  std::scoped_lock lock(_mutex);
  return _received;
}

std::vector<ProtocolMessage> FakeServer::receivedOfType(std::string_view type) const {
  std::vector<ProtocolMessage> ret;
  std::scoped_lock lock(_mutex);
  for (const auto& msg : _received) {
    if (msg.type == type) {
      ret.push_back(msg);
    }
  }
  return ret;
}

bool FakeServer::waitForReceived(std::string_view type, std::size_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(_mutex);
  return _receivedCv.wait_for(lock, timeout, [this, type, count] {
    return static_cast<std::size_t>(std::ranges::count_if(
               _received, [type](const ProtocolMessage& msg) { return msg.type == type; })) >= count;
  });
}

std::size_t FakeServer::channelsCreated() const {
  std::scoped_lock lock(_mutex);
  return _channelsCreated;
}

void FakeServer::drain() {
  std::unique_lock lock(_tasksMutex);
  _idleCv.wait(lock, [this] { return _tasks.empty() && !_busy; });
}

void FakeServer::post(std::function<void()> task) {
  {
    std::scoped_lock lock(_tasksMutex);
    _tasks.push_back(std::move(task));
  }
  _tasksCv.notify_one();
}

void FakeServer::onOpen(const std::shared_ptr<Endpoint>& endpoint) {
  OpenBehavior openBehavior;
  {
    std::scoped_lock lock(_mutex);
    openBehavior = _openBehavior;
    if (openBehavior == OpenBehavior::Accept) {
      _current = endpoint;
    }
  }
  switch (openBehavior) {
    case OpenBehavior::Accept:
      DeliverOpen(*endpoint);
      DeliverMessage(*endpoint, SerializeMessage(MakeMessage(msgtype::kConnected)));
      break;
    case OpenBehavior::Refuse:
      DeliverClose(*endpoint, "connection refused");
      break;
    case OpenBehavior::Hang:
      [[fallthrough]];
    default:
      break;
  }
}

void FakeServer::onClientMessage(const std::shared_ptr<Endpoint>& endpoint, const std::string& text) {
  if (IsClosed(*endpoint)) {
    return;
  }
  ProtocolMessage msg = ParseMessage(text);
  Responder responder;
  {
    std::scoped_lock lock(_mutex);
    _received.push_back(msg);
    if (auto it = _responders.find(msg.type); it != _responders.end()) {
      responder = it->second;
    }
  }
  _receivedCv.notify_all();
  if (responder) {
    for (const auto& reply : responder(msg)) {
      DeliverMessage(*endpoint, SerializeMessage(reply));
    }
  }
}

void FakeServer::onClientClose(const std::shared_ptr<Endpoint>& endpoint) {
  {
    std::scoped_lock lock(_mutex);
    if (_current == endpoint) {
      _current.reset();
    }
  }
  DeliverClose(*endpoint, "closed by client");
}

FakeChannel::FakeChannel(FakeServer& server, std::shared_ptr<FakeServer::Endpoint> endpoint)
    : _server(server), _endpoint(std::move(endpoint)) {}

FakeChannel::~FakeChannel() {
  std::scoped_lock lock(_endpoint->callbackMutex);
  _endpoint->closed = true;
}

void FakeChannel::open(Callbacks callbacks) {
  _endpoint->callbacks = std::move(callbacks);
  _server.post([&server = _server, endpoint = _endpoint]() { server.onOpen(endpoint); });
}

void FakeChannel::send(std::string text) {
  _server.post(
      [&server = _server, endpoint = _endpoint, text = std::move(text)]() { server.onClientMessage(endpoint, text); });
}

void FakeChannel::close() {
  _server.post([&server = _server, endpoint = _endpoint]() { server.onClientClose(endpoint); });
}

}  // namespace logwire::test
