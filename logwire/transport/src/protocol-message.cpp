#include "logwire/protocol-message.hpp"

#include <stdexcept>
#include <string>
#include <string_view>

#include "logwire/fmt.hpp"
#include "logwire/json-serializer.hpp"
#include "logwire/timedef.hpp"
#include "logwire/transport-errors.hpp"

namespace logwire {

ProtocolMessage MakeMessage(std::string_view type) {
  ProtocolMessage msg;
  msg.type = type;
  msg.timestamp = UnixMillisNow();
  return msg;
}

std::string SerializeMessage(const ProtocolMessage& msg) { return SerializeToJson(msg); }

ProtocolMessage ParseMessage(std::string_view text) {
  auto msg = ParseJson<ProtocolMessage>(text);
  if (msg.type.empty()) {
    throw std::invalid_argument("Message without type");
  }
  return msg;
}

void ThrowInvalidPayload(std::string_view type, std::string_view reason) {
  throw ProtocolError(fmt::format("Invalid '{}' payload: {}", type, reason));
}

}  // namespace logwire
