#include "logwire/websocket-url.hpp"

#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "logwire/fmt.hpp"
#include "logwire/string-equal-ignore-case.hpp"

namespace logwire::websocket {

namespace {

constexpr uint16_t kDefaultWsPort = 80;
constexpr uint16_t kDefaultWssPort = 443;

}  // namespace

WebSocketUrl WebSocketUrl::Parse(std::string_view url) {
  WebSocketUrl ret;

  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string_view::npos) {
    throw std::invalid_argument(fmt::format("Missing scheme in WebSocket URL '{}'", url));
  }
  const std::string_view scheme = url.substr(0, schemeEnd);
  if (CaseInsensitiveEqual(scheme, "wss")) {
    ret.secure = true;
  } else if (!CaseInsensitiveEqual(scheme, "ws")) {
    throw std::invalid_argument(fmt::format("Unsupported scheme '{}' in WebSocket URL, expected ws or wss", scheme));
  }

  std::string_view rest = url.substr(schemeEnd + 3);
  const auto pathStart = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, pathStart);
  const std::string_view target = pathStart == std::string_view::npos ? std::string_view{} : rest.substr(pathStart);

  if (authority.find('@') != std::string_view::npos) {
    throw std::invalid_argument("User info is not supported in WebSocket URL");
  }

  std::string_view host;
  std::string_view portStr;
  if (authority.starts_with('[')) {
    const auto closing = authority.find(']');
    if (closing == std::string_view::npos) {
      throw std::invalid_argument(fmt::format("Unterminated IPv6 literal in WebSocket URL '{}'", url));
    }
    host = authority.substr(1, closing - 1);
    const std::string_view afterHost = authority.substr(closing + 1);
    if (!afterHost.empty()) {
      if (afterHost.front() != ':') {
        throw std::invalid_argument(fmt::format("Unexpected characters after IPv6 literal in '{}'", url));
      }
      portStr = afterHost.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    host = authority.substr(0, colon);
    if (colon != std::string_view::npos) {
      portStr = authority.substr(colon + 1);
    }
  }
  if (host.empty()) {
    throw std::invalid_argument(fmt::format("Missing host in WebSocket URL '{}'", url));
  }

  if (portStr.empty()) {
    ret.port = ret.secure ? kDefaultWssPort : kDefaultWsPort;
  } else {
    const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), ret.port);
    if (errc != std::errc{} || ptr != portStr.data() + portStr.size() || ret.port == 0) {
      throw std::invalid_argument(fmt::format("Invalid port '{}' in WebSocket URL", portStr));
    }
  }

  ret.host = host;
  if (target.empty()) {
    ret.target = kDefaultUploadPath;
  } else if (target.front() == '?') {
    ret.target = fmt::format("{}{}", kDefaultUploadPath, target);
  } else {
    ret.target = target;
  }
  if (const auto fragment = ret.target.find('#'); fragment != std::string::npos) {
    ret.target.resize(fragment);
  }
  return ret;
}

std::string WebSocketUrl::authority() const {
  const bool isIpv6 = host.find(':') != std::string::npos;
  const bool defaultPort = port == (secure ? kDefaultWssPort : kDefaultWsPort);
  if (defaultPort) {
    return isIpv6 ? fmt::format("[{}]", host) : host;
  }
  return isIpv6 ? fmt::format("[{}]:{}", host, port) : fmt::format("{}:{}", host, port);
}

}  // namespace logwire::websocket
