#include "logwire/transport-config.hpp"

#include <chrono>
#include <stdexcept>

#include "logwire/features.hpp"
#include "logwire/fmt.hpp"
#include "logwire/websocket-url.hpp"

namespace logwire {

void TransportConfig::validate() const {
  const auto parsedUrl = websocket::WebSocketUrl::Parse(url);
  if (parsedUrl.secure && !openSslEnabled()) {
    throw std::invalid_argument(fmt::format("Cannot connect to '{}', logwire was built without OpenSSL support", url));
  }
  if (connectTimeout <= std::chrono::milliseconds{0}) {
    throw std::invalid_argument("Connect timeout should be strictly positive");
  }
  if (keepAliveInterval < std::chrono::milliseconds{0}) {
    throw std::invalid_argument("Keep alive interval should not be negative");
  }
  if (maxMessageSize == 0) {
    throw std::invalid_argument("Max message size should be strictly positive");
  }
}

}  // namespace logwire
