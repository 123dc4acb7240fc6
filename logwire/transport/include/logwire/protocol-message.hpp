#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "logwire/json-serializer.hpp"
#include "logwire/timedef.hpp"

namespace logwire {

// Message types exchanged over the upload channel.
namespace msgtype {

// client -> server
inline constexpr std::string_view kUploadInit = "upload:init";
inline constexpr std::string_view kUploadChunk = "upload:chunk";
inline constexpr std::string_view kUploadComplete = "upload:complete";
inline constexpr std::string_view kMapUpload = "map:upload";
inline constexpr std::string_view kRulesUpload = "rules:upload";
inline constexpr std::string_view kCarrierUpload = "carrier:upload";

// server -> client
inline constexpr std::string_view kConnected = "connected";
inline constexpr std::string_view kAck = "ack";
inline constexpr std::string_view kProgress = "progress";
inline constexpr std::string_view kProcessing = "processing";
inline constexpr std::string_view kComplete = "complete";
inline constexpr std::string_view kError = "error";

// either direction
inline constexpr std::string_view kPing = "ping";
inline constexpr std::string_view kPong = "pong";

}  // namespace msgtype

// Envelope of every message: {type, id?, payload?, timestamp}.
// The payload is kept as raw JSON text, decoded on demand by the consumer that knows its shape.
struct ProtocolMessage {
  std::string type;
  std::optional<std::string> id;
  std::optional<glz::raw_json> payload;
  int64_t timestamp{};

  [[nodiscard]] bool hasPayload() const noexcept { return payload.has_value() && !payload->str.empty(); }

  // Decode the payload into T. Throws ProtocolError if the payload is missing or does not match T.
  template <class T>
  [[nodiscard]] T payloadAs() const;
};

// Build a message stamped with the current time.
[[nodiscard]] ProtocolMessage MakeMessage(std::string_view type);

template <class T>
[[nodiscard]] ProtocolMessage MakeMessage(std::string_view type, const T& payload) {
  ProtocolMessage msg = MakeMessage(type);
  msg.payload = glz::raw_json{SerializeToJson(payload)};
  return msg;
}

[[nodiscard]] std::string SerializeMessage(const ProtocolMessage& msg);

// Parse one inbound text frame. Throws std::invalid_argument if it is not a valid envelope (missing type included).
[[nodiscard]] ProtocolMessage ParseMessage(std::string_view text);

// Implemented out of line to keep the error types out of this header's consumers.
[[noreturn]] void ThrowInvalidPayload(std::string_view type, std::string_view reason);

template <class T>
T ProtocolMessage::payloadAs() const {
  if (!hasPayload()) {
    ThrowInvalidPayload(type, "missing payload");
  }
  T obj{};
  try {
    ParseJson(payload->str, obj);
  } catch (const std::invalid_argument& ex) {
    ThrowInvalidPayload(type, ex.what());
  }
  return obj;
}

}  // namespace logwire

template <>
struct glz::meta<logwire::ProtocolMessage> {
  using T = logwire::ProtocolMessage;
  static constexpr auto value =
      glz::object("type", &T::type, "id", &T::id, "payload", &T::payload, "timestamp", &T::timestamp);
};
