#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace logwire::websocket {

// WebSocket Protocol Constants (RFC 6455)
// ========================================

// The magic GUID used in the Sec-WebSocket-Accept calculation (RFC 6455 §1.3)
inline constexpr std::string_view kGUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

inline constexpr std::string_view kWebSocketVersion = "13";

// Header field names specific to the WebSocket handshake
inline constexpr std::string_view SecWebSocketKey = "Sec-WebSocket-Key";
inline constexpr std::string_view SecWebSocketAccept = "Sec-WebSocket-Accept";
inline constexpr std::string_view SecWebSocketVersion = "Sec-WebSocket-Version";

inline constexpr std::string_view UpgradeValue = "websocket";

// WebSocket Frame Opcodes (RFC 6455 §5.2)
enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA,
};

[[nodiscard]] constexpr bool IsControlFrame(Opcode op) noexcept { return static_cast<uint8_t>(op) >= 0x8; }

// Reserved non-control: 0x3-0x7, reserved control: 0xB-0xF
[[nodiscard]] constexpr bool IsReservedOpcode(std::byte rawOpcode) noexcept {
  return (rawOpcode >= std::byte{0x3} && rawOpcode <= std::byte{0x7}) ||
         (rawOpcode >= std::byte{0xB} && rawOpcode <= std::byte{0xF});
}

// WebSocket Close Status Codes (RFC 6455 §7.4.1)
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  ProtocolError = 1002,
  UnsupportedData = 1003,
  NoStatusReceived = 1005,  // API only, never sent on the wire
  AbnormalClosure = 1006,   // API only, never sent on the wire
  InvalidPayloadData = 1007,
  PolicyViolation = 1008,
  MessageTooBig = 1009,
  InternalError = 1011,
};

// First byte of frame: FIN | RSV1 | RSV2 | RSV3 | OPCODE (4 bits)
inline constexpr std::byte kFinBit{0x80};
inline constexpr std::byte kRsvBits{0x70};
inline constexpr std::byte kOpcodeMask{0x0F};

// Second byte: MASK | Payload length (7 bits)
inline constexpr std::byte kMaskBit{0x80};
inline constexpr std::byte kPayloadLenMask{0x7F};

// Extended payload length indicators
inline constexpr std::byte kPayloadLen16{126};
inline constexpr std::byte kPayloadLen64{127};

// Maximum control frame payload size (RFC 6455 §5.5)
inline constexpr std::size_t kMaxControlFramePayload = 125;

inline constexpr std::size_t kMaskingKeySize = 4;

inline constexpr std::size_t kMinFrameHeaderSize = 2;
inline constexpr std::size_t kMaxFrameHeaderSize = 2 + 8 + kMaskingKeySize;

// Upload chunks travel base64 encoded in a single text message, so the default limit leaves room for a
// 5 MiB chunk and its JSON envelope.
inline constexpr std::size_t kDefaultMaxMessageSize = 64UL * 1024UL * 1024UL;

}  // namespace logwire::websocket
