#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>

#include "logwire/websocket-constants.hpp"
#include "logwire/websocket-frame.hpp"

namespace logwire::websocket {

/// Configuration options for WebSocket connections.
struct WebSocketConfig {
  /// Maximum size of a single message (after reassembly from fragments).
  /// Set to 0 for unlimited (use with caution).
  std::size_t maxMessageSize{kDefaultMaxMessageSize};

  /// Close timeout to wait for close response.
  std::chrono::milliseconds closeTimeout{std::chrono::milliseconds{5000}};

  /// Whether this is the server side (affects masking in both directions).
  bool isServerSide{false};
};

/// Callbacks for WebSocket events, invoked synchronously from processInput().
struct WebSocketCallbacks {
  /// Called when a complete message (text or binary) is received.
  /// For text messages, the payload is guaranteed to be valid UTF-8.
  std::function<void(std::span<const std::byte> payload, bool isBinary)> onMessage;

  /// Called when a Ping frame is received. The Pong answer is queued automatically.
  std::function<void(std::span<const std::byte> payload)> onPing;

  std::function<void(std::span<const std::byte> payload)> onPong;

  /// Called when a Close frame is received. The close handshake is handled automatically.
  std::function<void(CloseCode code, std::string_view reason)> onClose;

  /// Called when a protocol error occurs. A Close frame is queued and processInput() returns Close.
  std::function<void(CloseCode code, std::string_view message)> onError;
};

/// RFC 6455 framing state machine, independent of the underlying transport.
///
/// Usage:
///   1. Create with configuration and callbacks once the upgrade handshake succeeded
///   2. Feed incoming bytes through processInput()
///   3. Queue messages with sendText/sendBinary/sendPing/sendClose
///   4. Write getPendingOutput() to the transport and report progress with onOutputWritten()
///
/// Client side handlers mask every outgoing frame with a fresh random key.
/// Thread safety: Not thread-safe (designed for single-threaded event loop).
class WebSocketHandler {
 public:
  enum class Action : uint8_t {
    Continue,  // Keep reading
    Close      // Flush pending output then close the transport
  };

  explicit WebSocketHandler(WebSocketConfig config = {}, WebSocketCallbacks callbacks = {});

  WebSocketHandler(const WebSocketHandler&) = delete;
  WebSocketHandler& operator=(const WebSocketHandler&) = delete;
  WebSocketHandler(WebSocketHandler&&) noexcept = default;
  WebSocketHandler& operator=(WebSocketHandler&&) noexcept = default;

  ~WebSocketHandler() = default;

  /// Consume raw bytes received from the peer. Incomplete frames are kept for the next call.
  [[nodiscard]] Action processInput(std::span<const std::byte> data);

  [[nodiscard]] bool hasPendingOutput() const noexcept { return _outputOffset < _outputBuffer.size(); }

  [[nodiscard]] std::span<const std::byte> getPendingOutput() const noexcept;

  void onOutputWritten(std::size_t bytesWritten);

  /// Transport is gone: no more frames can be exchanged.
  void onTransportClosing();

  void setCallbacks(WebSocketCallbacks callbacks);

  /// Queue a text message.
  /// @return true if queued successfully, false if connection is closing
  bool sendText(std::string_view text);

  bool sendBinary(std::span<const std::byte> data);

  /// Queue a Ping frame (payload truncated to 125 bytes).
  bool sendPing(std::span<const std::byte> payload = {});

  /// Queue a Pong frame (usually automatic in response to Ping).
  bool sendPong(std::span<const std::byte> payload);

  /// Initiate close handshake.
  /// @return true if close frame was queued, false if already closing
  bool sendClose(CloseCode code = CloseCode::Normal, std::string_view reason = {});

  [[nodiscard]] bool isClosing() const noexcept { return _closeState != CloseState::Open; }

  /// Check if the close handshake is complete (ready to close transport).
  [[nodiscard]] bool isCloseComplete() const noexcept { return _closeState == CloseState::Closed; }

  [[nodiscard]] CloseCode closeCode() const noexcept { return _closeCode; }

  [[nodiscard]] const WebSocketConfig& config() const noexcept { return _config; }

  /// Check if we've been waiting for a close response longer than closeTimeout.
  [[nodiscard]] bool hasCloseTimedOut() const noexcept {
    return _closeState == CloseState::CloseSent &&
           std::chrono::steady_clock::now() - _closeInitiatedAt > _config.closeTimeout;
  }

 private:
  enum class CloseState : uint8_t {
    Open,           // Normal operation
    CloseSent,      // We sent Close, waiting for peer's Close
    CloseReceived,  // Peer sent Close, we need to respond
    Closed          // Close handshake complete
  };

  /// State for message reassembly from fragments.
  struct MessageState {
    std::vector<std::byte> buffer;
    Opcode opcode{Opcode::Text};
    bool inProgress{false};
  };

  Action processFrame(const FrameParseResult& frame);

  Action handleDataFrame(const FrameHeader& header, std::span<const std::byte> payload);

  Action handleControlFrame(const FrameHeader& header, std::span<const std::byte> payload);

  Action completeMessage();

  Action failConnection(CloseCode code, std::string_view message);

  void queueFrame(Opcode opcode, std::span<const std::byte> payload);

  [[nodiscard]] MaskingKey nextMaskingKey() const;

  WebSocketConfig _config;
  WebSocketCallbacks _callbacks;
  std::chrono::steady_clock::time_point _closeInitiatedAt;
  std::vector<std::byte> _outputBuffer;
  std::size_t _outputOffset{0};
  MessageState _message;
  std::vector<std::byte> _inputBuffer;  // Carry-over from incomplete frames
  CloseCode _closeCode{CloseCode::NoStatusReceived};
  CloseState _closeState{CloseState::Open};
};

/// Validate UTF-8 encoding (RFC 3629): no overlong forms, no surrogates, nothing above U+10FFFF.
[[nodiscard]] bool IsValidUtf8(std::span<const std::byte> data) noexcept;

}  // namespace logwire::websocket
