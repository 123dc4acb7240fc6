#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

#include "logwire/websocket-constants.hpp"

namespace logwire {

struct TransportConfig {
  static constexpr std::chrono::milliseconds kDefaultConnectTimeout{std::chrono::seconds{10}};
  static constexpr std::chrono::milliseconds kDefaultKeepAliveInterval{std::chrono::seconds{30}};

  // Throws std::invalid_argument if the configuration is not usable.
  void validate() const;

  TransportConfig& withUrl(std::string value) {
    url = std::move(value);
    return *this;
  }

  TransportConfig& withConnectTimeout(std::chrono::milliseconds value) {
    connectTimeout = value;
    return *this;
  }

  // A zero interval disables the keepalive ping.
  TransportConfig& withKeepAliveInterval(std::chrono::milliseconds value) {
    keepAliveInterval = value;
    return *this;
  }

  TransportConfig& withMaxMessageSize(std::size_t value) {
    maxMessageSize = value;
    return *this;
  }

  TransportConfig& withTlsVerifyPeer(bool value) {
    tlsVerifyPeer = value;
    return *this;
  }

  TransportConfig& withTlsCaFile(std::string value) {
    tlsCaFile = std::move(value);
    return *this;
  }

  // ws:// or wss:// endpoint. Missing path defaults to /api/ws/uploads.
  std::string url{"ws://127.0.0.1:8089/api/ws/uploads"};

  // Maximum time for connect() to see the channel open.
  std::chrono::milliseconds connectTimeout{kDefaultConnectTimeout};

  // Interval between two application level pings while connected.
  std::chrono::milliseconds keepAliveInterval{kDefaultKeepAliveInterval};

  // Maximum size of one inbound message.
  std::size_t maxMessageSize{websocket::kDefaultMaxMessageSize};

  // wss:// only
  bool tlsVerifyPeer{true};
  std::string tlsCaFile;
};

}  // namespace logwire
