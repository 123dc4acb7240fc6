#include "logwire/websocket-frame.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "logwire/websocket-constants.hpp"

namespace logwire::websocket {

namespace {

FrameParseResult Fail(FrameParseResult result, FrameParseResult::Status status, std::string_view message) {
  result.status = status;
  result.errorMessage = message;
  return result;
}

}  // namespace

FrameParseResult ParseFrame(std::span<const std::byte> data, std::size_t maxPayloadSize, bool isServerSide) {
  using Status = FrameParseResult::Status;

  FrameParseResult result;
  if (data.size() < kMinFrameHeaderSize) {
    return result;
  }

  const std::byte byte0 = data[0];
  result.header.fin = (byte0 & kFinBit) != std::byte{0};
  if ((byte0 & kRsvBits) != std::byte{0}) {
    // No extension is ever negotiated
    return Fail(result, Status::ProtocolError, "Reserved bits must be 0");
  }

  const std::byte rawOpcode = byte0 & kOpcodeMask;
  if (IsReservedOpcode(rawOpcode)) {
    return Fail(result, Status::ProtocolError, "Reserved opcode");
  }
  result.header.opcode = static_cast<Opcode>(rawOpcode);

  if (IsControlFrame(result.header.opcode) && !result.header.fin) {
    return Fail(result, Status::ProtocolError, "Control frames must not be fragmented");
  }

  const std::byte byte1 = data[1];
  result.header.masked = (byte1 & kMaskBit) != std::byte{0};
  if (isServerSide && !result.header.masked) {
    return Fail(result, Status::ProtocolError, "Client frames must be masked");
  }
  if (!isServerSide && result.header.masked) {
    return Fail(result, Status::ProtocolError, "Server frames must not be masked");
  }

  const std::byte payloadLen7 = byte1 & kPayloadLenMask;
  std::size_t offset = kMinFrameHeaderSize;

  if (payloadLen7 == kPayloadLen16 || payloadLen7 == kPayloadLen64) {
    const std::size_t nbLenBytes = payloadLen7 == kPayloadLen16 ? 2 : 8;
    if (data.size() < offset + nbLenBytes) {
      return result;
    }
    uint64_t len = 0;
    for (std::size_t idx = 0; idx < nbLenBytes; ++idx) {
      len = (len << 8) | static_cast<uint64_t>(data[offset + idx]);
    }
    offset += nbLenBytes;

    if (nbLenBytes == 8 && (len >> 63) != 0) {
      return Fail(result, Status::ProtocolError, "Invalid payload length (MSB set)");
    }
    // RFC 6455 §5.2: the minimal number of bytes MUST be used to encode the length
    const uint64_t minLen = nbLenBytes == 2 ? static_cast<uint64_t>(kPayloadLen16) : 0x10000UL;
    if (len < minLen) {
      return Fail(result, Status::ProtocolError, "Non-minimal extended length encoding");
    }
    result.header.payloadLength = len;
  } else {
    result.header.payloadLength = static_cast<uint64_t>(payloadLen7);
  }

  if (IsControlFrame(result.header.opcode) && result.header.payloadLength > kMaxControlFramePayload) {
    return Fail(result, Status::ProtocolError, "Control frame payload too large");
  }
  if (maxPayloadSize > 0 && result.header.payloadLength > maxPayloadSize) {
    return Fail(result, Status::PayloadTooLarge, "Payload exceeds maximum size");
  }

  if (result.header.masked) {
    if (data.size() < offset + kMaskingKeySize) {
      return result;
    }
    for (std::size_t idx = 0; idx < kMaskingKeySize; ++idx) {
      result.header.maskingKey[idx] = data[offset + idx];
    }
    offset += kMaskingKeySize;
  }

  if (data.size() - offset < result.header.payloadLength) {
    return result;
  }

  const auto payloadLen = static_cast<std::size_t>(result.header.payloadLength);
  result.status = Status::Complete;
  result.payload = data.subspan(offset, payloadLen);
  result.bytesConsumed = offset + payloadLen;
  return result;
}

void ApplyMask(std::span<std::byte> data, const MaskingKey& maskingKey) noexcept {
  for (std::size_t idx = 0; idx < data.size(); ++idx) {
    data[idx] ^= maskingKey[idx & 3U];
  }
}

void BuildFrame(std::vector<std::byte>& output, Opcode opcode, std::span<const std::byte> payload, bool fin,
                bool mask, const MaskingKey& maskingKey) {
  const std::size_t payloadSize = payload.size();

  output.reserve(output.size() + kMaxFrameHeaderSize + payloadSize);

  std::byte byte0 = static_cast<std::byte>(opcode);
  if (fin) {
    byte0 |= kFinBit;
  }
  output.push_back(byte0);

  const std::byte maskFlag = mask ? kMaskBit : std::byte{0};
  if (payloadSize < static_cast<std::size_t>(kPayloadLen16)) {
    output.push_back(maskFlag | static_cast<std::byte>(payloadSize));
  } else if (payloadSize <= 0xFFFF) {
    output.push_back(maskFlag | kPayloadLen16);
    output.push_back(static_cast<std::byte>((payloadSize >> 8) & 0xFF));
    output.push_back(static_cast<std::byte>(payloadSize & 0xFF));
  } else {
    output.push_back(maskFlag | kPayloadLen64);
    for (int idx = 7; idx >= 0; --idx) {
      output.push_back(static_cast<std::byte>((static_cast<uint64_t>(payloadSize) >> (idx * 8)) & 0xFF));
    }
  }

  if (mask) {
    output.insert(output.end(), maskingKey.begin(), maskingKey.end());
  }

  const std::size_t payloadStart = output.size();
  output.insert(output.end(), payload.begin(), payload.end());
  if (mask) {
    ApplyMask(std::span<std::byte>(output).subspan(payloadStart), maskingKey);
  }
}

void BuildCloseFrame(std::vector<std::byte>& output, CloseCode code, std::string_view reason, bool mask,
                     const MaskingKey& maskingKey) {
  std::vector<std::byte> closePayload;

  if (code != CloseCode::NoStatusReceived) {
    const auto codeVal = static_cast<uint16_t>(code);
    closePayload.push_back(static_cast<std::byte>((codeVal >> 8) & 0xFF));
    closePayload.push_back(static_cast<std::byte>(codeVal & 0xFF));

    static constexpr std::size_t kMaxReasonLen = kMaxControlFramePayload - 2;
    reason = reason.substr(0, kMaxReasonLen);
    const auto reasonBytes = std::as_bytes(std::span(reason));
    closePayload.insert(closePayload.end(), reasonBytes.begin(), reasonBytes.end());
  }

  BuildFrame(output, Opcode::Close, std::span<const std::byte>(closePayload), true, mask, maskingKey);
}

ClosePayload ParseClosePayload(std::span<const std::byte> payload) {
  ClosePayload result;

  if (payload.size() >= 2) {
    result.code = static_cast<CloseCode>((static_cast<uint16_t>(payload[0]) << 8) | static_cast<uint16_t>(payload[1]));
    if (payload.size() > 2) {
      result.reason = std::string_view(reinterpret_cast<const char*>(payload.data() + 2), payload.size() - 2);
    }
  } else if (!payload.empty()) {
    // 1 byte is invalid per RFC 6455
    result.code = CloseCode::ProtocolError;
  }

  return result;
}

}  // namespace logwire::websocket
