#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace logwire::websocket {

// Base64-encoded SHA-1 is always 28 chars
using B64EncodedSha1 = std::array<char, 28>;

/// Generate a fresh Sec-WebSocket-Key: 16 random bytes, base64 encoded (24 chars).
[[nodiscard]] std::string GenerateWebSocketKey();

/// Validate the format of a Sec-WebSocket-Key.
/// A valid key is exactly 24 base64 characters (representing 16 random bytes).
[[nodiscard]] bool IsValidWebSocketKey(std::string_view key);

/// Compute the Sec-WebSocket-Accept value from a client's Sec-WebSocket-Key.
///
/// The algorithm (RFC 6455 §1.3):
///   1. Concatenate the key with the WebSocket GUID
///   2. Compute SHA-1 hash
///   3. Base64 encode the result
[[nodiscard]] B64EncodedSha1 ComputeWebSocketAccept(std::string_view key);

/// Build the HTTP/1.1 GET request asking the server to switch to the WebSocket protocol.
/// 'authority' is the Host header value (see WebSocketUrl::authority()).
[[nodiscard]] std::string BuildUpgradeRequest(std::string_view authority, std::string_view target,
                                              std::string_view key);

struct UpgradeResponse {
  enum class Status : uint8_t { Incomplete, Accepted, Rejected };

  Status status{Status::Incomplete};
  int statusCode{0};
  // Bytes of the HTTP response head, including the terminating empty line.
  // Anything after it already belongs to the WebSocket stream.
  std::size_t headSize{0};
  std::string_view errorMessage;
};

/// Parse the server answer to an upgrade request sent with 'key'.
/// Accepted requires a 101 status, 'Upgrade: websocket', 'Connection: upgrade' and the matching accept key.
[[nodiscard]] UpgradeResponse ParseUpgradeResponse(std::string_view data, std::string_view key);

struct UpgradeRequest {
  enum class Status : uint8_t { Incomplete, Valid, Invalid };

  Status status{Status::Incomplete};
  std::string_view target;
  std::string_view key;
  std::size_t headSize{0};
};

/// Parse an upgrade request on the server side. Views point into 'data'.
[[nodiscard]] UpgradeRequest ParseUpgradeRequest(std::string_view data);

/// Build the '101 Switching Protocols' answer to a valid upgrade request.
[[nodiscard]] std::string BuildUpgradeResponse(std::string_view key);

}  // namespace logwire::websocket
