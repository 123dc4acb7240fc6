#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "logwire/websocket-constants.hpp"

namespace logwire::websocket {

/// 4-byte masking key, in wire order.
using MaskingKey = std::array<std::byte, kMaskingKeySize>;

/// Parsed WebSocket frame header.
struct FrameHeader {
  Opcode opcode{Opcode::Text};
  bool fin{true};
  bool masked{false};
  uint64_t payloadLength{0};
  MaskingKey maskingKey{};
};

/// Result of parsing a WebSocket frame from raw bytes.
/// The payload is a view into the input buffer.
struct FrameParseResult {
  enum class Status : uint8_t {
    Complete,        // Frame fully parsed, header and payload available
    Incomplete,      // Need more data to parse the frame
    ProtocolError,   // Invalid frame format (close with 1002)
    PayloadTooLarge  // Payload exceeds configured maximum (close with 1009)
  };

  Status status{Status::Incomplete};
  FrameHeader header;
  std::span<const std::byte> payload;
  std::size_t bytesConsumed{0};
  std::string_view errorMessage;
};

/// Parse a WebSocket frame from raw bytes.
///
/// @param data           Input buffer containing raw WebSocket data
/// @param maxPayloadSize Maximum allowed payload size (0 = unlimited)
/// @param isServerSide   True if we're the server (clients MUST mask, servers MUST NOT)
[[nodiscard]] FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxPayloadSize = 0,
                                          bool isServerSide = false);

/// XOR masking, symmetric: the same call masks and unmasks in place.
void ApplyMask(std::span<std::byte> data, const MaskingKey& maskingKey) noexcept;

/// Build a WebSocket frame and append it to 'output'.
/// Control frames (Close, Ping, Pong) must have payload <= 125 bytes and FIN=true.
void BuildFrame(std::vector<std::byte>& output, Opcode opcode, std::span<const std::byte> payload, bool fin = true,
                bool mask = false, const MaskingKey& maskingKey = {});

inline void BuildFrame(std::vector<std::byte>& output, Opcode opcode, std::string_view payload, bool fin = true,
                       bool mask = false, const MaskingKey& maskingKey = {}) {
  BuildFrame(output, opcode, std::as_bytes(std::span(payload)), fin, mask, maskingKey);
}

/// Build a Close frame with a status code and an optional reason (truncated to fit a control frame).
/// CloseCode::NoStatusReceived gives an empty payload.
void BuildCloseFrame(std::vector<std::byte>& output, CloseCode code = CloseCode::Normal, std::string_view reason = {},
                     bool mask = false, const MaskingKey& maskingKey = {});

struct ClosePayload {
  CloseCode code{CloseCode::NoStatusReceived};
  std::string_view reason;
};

/// Parse a Close frame payload. An empty payload gives NoStatusReceived, a 1-byte payload ProtocolError.
[[nodiscard]] ClosePayload ParseClosePayload(std::span<const std::byte> payload);

}  // namespace logwire::websocket
