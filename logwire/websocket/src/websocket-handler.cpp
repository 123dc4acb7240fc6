#include "logwire/websocket-handler.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "logwire/log.hpp"
#include "logwire/random-bytes.hpp"
#include "logwire/websocket-constants.hpp"
#include "logwire/websocket-frame.hpp"

namespace logwire::websocket {

WebSocketHandler::WebSocketHandler(WebSocketConfig config, WebSocketCallbacks callbacks)
    : _config(std::move(config)), _callbacks(std::move(callbacks)) {}

void WebSocketHandler::setCallbacks(WebSocketCallbacks callbacks) { _callbacks = std::move(callbacks); }

WebSocketHandler::Action WebSocketHandler::processInput(std::span<const std::byte> data) {
  if (_closeState == CloseState::Closed) {
    return Action::Close;
  }

  // Append new data to any carry-over from previous call
  if (!_inputBuffer.empty()) {
    _inputBuffer.insert(_inputBuffer.end(), data.begin(), data.end());
    data = _inputBuffer;
  }

  std::size_t totalConsumed = 0;
  Action action = Action::Continue;

  while (totalConsumed < data.size()) {
    const auto frameResult = ParseFrame(data.subspan(totalConsumed), _config.maxMessageSize, _config.isServerSide);

    if (frameResult.status == FrameParseResult::Status::Incomplete) {
      break;
    }
    if (frameResult.status == FrameParseResult::Status::ProtocolError) {
      action = failConnection(CloseCode::ProtocolError, frameResult.errorMessage);
      break;
    }
    if (frameResult.status == FrameParseResult::Status::PayloadTooLarge) {
      action = failConnection(CloseCode::MessageTooBig, "Frame payload too large");
      break;
    }

    totalConsumed += frameResult.bytesConsumed;
    action = processFrame(frameResult);
    if (action == Action::Close) {
      break;
    }
  }

  if (action == Action::Close) {
    _inputBuffer.clear();
    return action;
  }

  // Keep the unparsed tail for the next call
  if (data.data() == _inputBuffer.data()) {
    _inputBuffer.erase(_inputBuffer.begin(), _inputBuffer.begin() + static_cast<std::ptrdiff_t>(totalConsumed));
  } else {
    _inputBuffer.assign(data.begin() + static_cast<std::ptrdiff_t>(totalConsumed), data.end());
  }
  return action;
}

WebSocketHandler::Action WebSocketHandler::processFrame(const FrameParseResult& frame) {
  std::span<const std::byte> payload = frame.payload;
  std::vector<std::byte> unmaskedPayload;

  if (frame.header.masked) {
    unmaskedPayload.assign(payload.begin(), payload.end());
    ApplyMask(unmaskedPayload, frame.header.maskingKey);
    payload = unmaskedPayload;
  }

  log::trace("WebSocket frame opcode={} fin={} size={}", static_cast<int>(frame.header.opcode), frame.header.fin,
             payload.size());

  if (IsControlFrame(frame.header.opcode)) {
    return handleControlFrame(frame.header, payload);
  }
  return handleDataFrame(frame.header, payload);
}

WebSocketHandler::Action WebSocketHandler::handleDataFrame(const FrameHeader& header,
                                                           std::span<const std::byte> payload) {
  if (header.opcode == Opcode::Continuation) {
    if (!_message.inProgress) {
      return failConnection(CloseCode::ProtocolError, "Unexpected continuation frame");
    }
  } else {
    if (_message.inProgress) {
      return failConnection(CloseCode::ProtocolError, "Expected continuation frame");
    }
    _message.opcode = header.opcode;
    _message.inProgress = true;
    _message.buffer.clear();
  }

  const std::size_t newSize = _message.buffer.size() + payload.size();
  if (_config.maxMessageSize > 0 && newSize > _config.maxMessageSize) {
    return failConnection(CloseCode::MessageTooBig, "Message too large");
  }

  _message.buffer.insert(_message.buffer.end(), payload.begin(), payload.end());

  if (header.fin) {
    return completeMessage();
  }
  return Action::Continue;
}

WebSocketHandler::Action WebSocketHandler::handleControlFrame(const FrameHeader& header,
                                                              std::span<const std::byte> payload) {
  switch (header.opcode) {
    case Opcode::Ping:
      sendPong(payload);
      if (_callbacks.onPing) {
        _callbacks.onPing(payload);
      }
      return Action::Continue;
    case Opcode::Pong:
      if (_callbacks.onPong) {
        _callbacks.onPong(payload);
      }
      return Action::Continue;
    case Opcode::Close: {
      const auto closeInfo = ParseClosePayload(payload);
      _closeCode = closeInfo.code;

      if (_closeState == CloseState::Open) {
        // Peer initiated close - echo the status code back
        _closeState = CloseState::CloseReceived;
        const CloseCode echoed = closeInfo.code == CloseCode::NoStatusReceived ? CloseCode::Normal : closeInfo.code;
        BuildCloseFrame(_outputBuffer, echoed, {}, !_config.isServerSide, nextMaskingKey());
      }
      _closeState = CloseState::Closed;

      if (_callbacks.onClose) {
        _callbacks.onClose(closeInfo.code, closeInfo.reason);
      }
      return Action::Close;
    }
    default:
      throw std::logic_error("handleControlFrame: unexpected control opcode encountered");
  }
}

WebSocketHandler::Action WebSocketHandler::completeMessage() {
  _message.inProgress = false;

  if (_message.opcode == Opcode::Text && !IsValidUtf8(_message.buffer)) {
    _message.buffer.clear();
    return failConnection(CloseCode::InvalidPayloadData, "Invalid UTF-8 in text message");
  }

  // Callbacks may queue frames, but never feed input recursively, so the buffer stays alive during the call.
  if (_callbacks.onMessage) {
    _callbacks.onMessage(_message.buffer, _message.opcode == Opcode::Binary);
  }
  _message.buffer.clear();
  return Action::Continue;
}

WebSocketHandler::Action WebSocketHandler::failConnection(CloseCode code, std::string_view message) {
  log::warn("WebSocket protocol failure ({}): {}", static_cast<uint16_t>(code), message);
  if (_callbacks.onError) {
    _callbacks.onError(code, message);
  }
  sendClose(code, message);
  _message.inProgress = false;
  _message.buffer.clear();
  return Action::Close;
}

std::span<const std::byte> WebSocketHandler::getPendingOutput() const noexcept {
  return std::span<const std::byte>(_outputBuffer).subspan(_outputOffset);
}

void WebSocketHandler::onOutputWritten(std::size_t bytesWritten) {
  _outputOffset += bytesWritten;
  if (_outputOffset >= _outputBuffer.size()) {
    _outputBuffer.clear();
    _outputOffset = 0;
  }
}

void WebSocketHandler::onTransportClosing() {
  _closeState = CloseState::Closed;
  _message.inProgress = false;
  _message.buffer.clear();
  _inputBuffer.clear();
}

MaskingKey WebSocketHandler::nextMaskingKey() const {
  MaskingKey key{};
  if (!_config.isServerSide) {
    FillRandomBytes(key);
  }
  return key;
}

void WebSocketHandler::queueFrame(Opcode opcode, std::span<const std::byte> payload) {
  BuildFrame(_outputBuffer, opcode, payload, true, !_config.isServerSide, nextMaskingKey());
}

bool WebSocketHandler::sendText(std::string_view text) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  queueFrame(Opcode::Text, std::as_bytes(std::span(text)));
  return true;
}

bool WebSocketHandler::sendBinary(std::span<const std::byte> data) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  queueFrame(Opcode::Binary, data);
  return true;
}

bool WebSocketHandler::sendPing(std::span<const std::byte> payload) {
  if (_closeState != CloseState::Open) {
    return false;
  }
  queueFrame(Opcode::Ping, payload.first(std::min(payload.size(), kMaxControlFramePayload)));
  return true;
}

bool WebSocketHandler::sendPong(std::span<const std::byte> payload) {
  // Pong can be sent even during close handshake (per RFC 6455)
  if (_closeState == CloseState::Closed) {
    return false;
  }
  queueFrame(Opcode::Pong, payload.first(std::min(payload.size(), kMaxControlFramePayload)));
  return true;
}

bool WebSocketHandler::sendClose(CloseCode code, std::string_view reason) {
  if (_closeState == CloseState::CloseSent || _closeState == CloseState::Closed) {
    return false;
  }

  BuildCloseFrame(_outputBuffer, code, reason, !_config.isServerSide, nextMaskingKey());

  if (_closeState == CloseState::Open) {
    _closeState = CloseState::CloseSent;
    _closeInitiatedAt = std::chrono::steady_clock::now();
  } else {
    _closeState = CloseState::Closed;
  }
  return true;
}

bool IsValidUtf8(std::span<const std::byte> data) noexcept {
  const auto* ptr = reinterpret_cast<const uint8_t*>(data.data());
  const auto* end = ptr + data.size();

  while (ptr < end) {
    uint8_t byte = *ptr++;
    if (byte <= 0x7F) {
      continue;
    }

    std::size_t remaining;
    uint32_t codepoint;
    uint32_t minCodepoint;
    if ((byte & 0xE0) == 0xC0) {
      remaining = 1;
      codepoint = byte & 0x1FU;
      minCodepoint = 0x80;
    } else if ((byte & 0xF0) == 0xE0) {
      remaining = 2;
      codepoint = byte & 0x0FU;
      minCodepoint = 0x800;
    } else if ((byte & 0xF8) == 0xF0) {
      remaining = 3;
      codepoint = byte & 0x07U;
      minCodepoint = 0x10000;
    } else {
      return false;
    }

    if (static_cast<std::size_t>(end - ptr) < remaining) {
      return false;
    }
    for (std::size_t idx = 0; idx < remaining; ++idx) {
      byte = *ptr++;
      if ((byte & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (byte & 0x3FU);
    }

    if (codepoint < minCodepoint || (codepoint >= 0xD800 && codepoint <= 0xDFFF) || codepoint > 0x10FFFF) {
      return false;
    }
  }
  return true;
}

}  // namespace logwire::websocket
