#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace logwire::websocket {

inline constexpr std::string_view kDefaultUploadPath = "/api/ws/uploads";

/// Components of a ws:// or wss:// URL.
struct WebSocketUrl {
  /// Parse 'url'. Missing port defaults to 80 (ws) or 443 (wss), missing path to kDefaultUploadPath.
  /// IPv6 literals are accepted in brackets. Throws std::invalid_argument on malformed input.
  static WebSocketUrl Parse(std::string_view url);

  /// 'host' for default ports, 'host:port' otherwise (brackets re-added around IPv6 literals).
  [[nodiscard]] std::string authority() const;

  bool operator==(const WebSocketUrl&) const noexcept = default;

  std::string host;
  std::string target;
  uint16_t port{0};
  bool secure{false};
};

}  // namespace logwire::websocket
