#include "logwire/websocket-frame.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "logwire/websocket-constants.hpp"

namespace logwire::websocket {
namespace {

std::span<const std::byte> sv_bytes(std::string_view sv) noexcept { return std::as_bytes(std::span(sv)); }

std::string_view to_sv(std::span<const std::byte> bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

constexpr MaskingKey kMask{std::byte{0x37}, std::byte{0xfa}, std::byte{0x21}, std::byte{0x3d}};

}  // namespace

class WebSocketFrameTest : public ::testing::Test {
 protected:
  std::vector<std::byte> buffer;
};

TEST_F(WebSocketFrameTest, UnmaskedTextFrameMatchesRfcExample) {
  // RFC 6455 §5.7: single-frame unmasked text message "Hello"
  BuildFrame(buffer, Opcode::Text, "Hello");
  const std::vector<std::byte> expected{std::byte{0x81}, std::byte{0x05}, std::byte{0x48}, std::byte{0x65},
                                        std::byte{0x6c}, std::byte{0x6c}, std::byte{0x6f}};
  EXPECT_EQ(buffer, expected);

  const auto result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(result.header.opcode, Opcode::Text);
  EXPECT_TRUE(result.header.fin);
  EXPECT_FALSE(result.header.masked);
  EXPECT_EQ(to_sv(result.payload), "Hello");
  EXPECT_EQ(result.bytesConsumed, buffer.size());
}

TEST_F(WebSocketFrameTest, MaskedTextFrameMatchesRfcExample) {
  BuildFrame(buffer, Opcode::Text, "Hello", true, true, kMask);
  const std::vector<std::byte> expected{std::byte{0x81}, std::byte{0x85}, std::byte{0x37}, std::byte{0xfa},
                                        std::byte{0x21}, std::byte{0x3d}, std::byte{0x7f}, std::byte{0x9f},
                                        std::byte{0x4d}, std::byte{0x51}, std::byte{0x58}};
  EXPECT_EQ(buffer, expected);

  const auto result = ParseFrame(buffer, 0, true);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_TRUE(result.header.masked);
  EXPECT_EQ(result.header.maskingKey, kMask);
  std::vector<std::byte> payload(result.payload.begin(), result.payload.end());
  ApplyMask(payload, result.header.maskingKey);
  EXPECT_EQ(to_sv(payload), "Hello");
}

TEST_F(WebSocketFrameTest, ExtendedLengths) {
  const std::string medium(300, 'm');
  BuildFrame(buffer, Opcode::Binary, medium);
  EXPECT_EQ(buffer[1], kPayloadLen16);
  EXPECT_EQ(buffer.size(), 2U + 2U + medium.size());
  auto result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(result.header.payloadLength, medium.size());

  buffer.clear();
  const std::string large(70000, 'L');
  BuildFrame(buffer, Opcode::Binary, large);
  EXPECT_EQ(buffer[1], kPayloadLen64);
  EXPECT_EQ(buffer.size(), 2U + 8U + large.size());
  result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(to_sv(result.payload), large);
}

TEST_F(WebSocketFrameTest, IncompleteFramesAskForMoreData) {
  const std::string payload(300, 'p');
  BuildFrame(buffer, Opcode::Text, payload, true, true, kMask);
  for (std::size_t len : {0U, 1U, 3U, 5U, 7U, 100U}) {
    EXPECT_EQ(ParseFrame(std::span<const std::byte>(buffer).first(len), 0, true).status,
              FrameParseResult::Status::Incomplete)
        << len;
  }
  EXPECT_EQ(ParseFrame(std::span<const std::byte>(buffer).first(buffer.size() - 1), 0, true).status,
            FrameParseResult::Status::Incomplete);
}

TEST_F(WebSocketFrameTest, TwoFramesInOneBuffer) {
  BuildFrame(buffer, Opcode::Text, "first");
  const std::size_t firstSize = buffer.size();
  BuildFrame(buffer, Opcode::Text, "second");

  const auto first = ParseFrame(buffer);
  ASSERT_EQ(first.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(first.bytesConsumed, firstSize);
  const auto second = ParseFrame(std::span<const std::byte>(buffer).subspan(first.bytesConsumed));
  ASSERT_EQ(second.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(to_sv(second.payload), "second");
}

TEST_F(WebSocketFrameTest, MaskingDirectionIsEnforced) {
  BuildFrame(buffer, Opcode::Text, "x");
  EXPECT_EQ(ParseFrame(buffer, 0, true).status, FrameParseResult::Status::ProtocolError);

  buffer.clear();
  BuildFrame(buffer, Opcode::Text, "x", true, true, kMask);
  EXPECT_EQ(ParseFrame(buffer, 0, false).status, FrameParseResult::Status::ProtocolError);
}

TEST_F(WebSocketFrameTest, ProtocolViolations) {
  // Reserved bit set
  std::vector<std::byte> rsv{std::byte{0xC1}, std::byte{0x00}};
  EXPECT_EQ(ParseFrame(rsv).status, FrameParseResult::Status::ProtocolError);

  // Reserved opcode 0x3
  std::vector<std::byte> reservedOpcode{std::byte{0x83}, std::byte{0x00}};
  EXPECT_EQ(ParseFrame(reservedOpcode).status, FrameParseResult::Status::ProtocolError);

  // Fragmented ping
  std::vector<std::byte> fragmentedPing{std::byte{0x09}, std::byte{0x00}};
  EXPECT_EQ(ParseFrame(fragmentedPing).status, FrameParseResult::Status::ProtocolError);

  // Control frame with 126 bytes payload
  std::vector<std::byte> bigPing{std::byte{0x89}, std::byte{126}, std::byte{0x00}, std::byte{126}};
  EXPECT_EQ(ParseFrame(bigPing).status, FrameParseResult::Status::ProtocolError);

  // 16-bit length used for a payload that fits 7 bits
  std::vector<std::byte> nonMinimal{std::byte{0x82}, std::byte{126}, std::byte{0x00}, std::byte{0x05}};
  EXPECT_EQ(ParseFrame(nonMinimal).status, FrameParseResult::Status::ProtocolError);
}

TEST_F(WebSocketFrameTest, PayloadTooLarge) {
  BuildFrame(buffer, Opcode::Binary, std::string(1000, 'b'));
  EXPECT_EQ(ParseFrame(buffer, 999).status, FrameParseResult::Status::PayloadTooLarge);
  EXPECT_EQ(ParseFrame(buffer, 1000).status, FrameParseResult::Status::Complete);
}

TEST_F(WebSocketFrameTest, ApplyMaskIsSymmetric) {
  const std::string_view text = "masking is an involution";
  const auto textBytes = sv_bytes(text);
  std::vector<std::byte> data(textBytes.begin(), textBytes.end());
  ApplyMask(data, kMask);
  EXPECT_NE(to_sv(data), text);
  ApplyMask(data, kMask);
  EXPECT_EQ(to_sv(data), text);
}

TEST_F(WebSocketFrameTest, CloseFrameRoundTrip) {
  BuildCloseFrame(buffer, CloseCode::GoingAway, "bye");
  const auto result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(result.header.opcode, Opcode::Close);
  const auto closePayload = ParseClosePayload(result.payload);
  EXPECT_EQ(closePayload.code, CloseCode::GoingAway);
  EXPECT_EQ(closePayload.reason, "bye");
}

TEST_F(WebSocketFrameTest, CloseFrameReasonIsTruncated) {
  BuildCloseFrame(buffer, CloseCode::Normal, std::string(300, 'r'));
  const auto result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_EQ(result.payload.size(), kMaxControlFramePayload);
}

TEST_F(WebSocketFrameTest, ParseClosePayloadEdgeCases) {
  EXPECT_EQ(ParseClosePayload({}).code, CloseCode::NoStatusReceived);
  const std::byte oneByte[]{std::byte{0x03}};
  EXPECT_EQ(ParseClosePayload(oneByte).code, CloseCode::ProtocolError);

  BuildCloseFrame(buffer, CloseCode::NoStatusReceived);
  const auto result = ParseFrame(buffer);
  ASSERT_EQ(result.status, FrameParseResult::Status::Complete);
  EXPECT_TRUE(result.payload.empty());
}

}  // namespace logwire::websocket
