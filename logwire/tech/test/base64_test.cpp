#include "logwire/base64.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace logwire {

namespace {

std::span<const std::byte> sv_bytes(std::string_view sv) { return std::as_bytes(std::span<const char>(sv)); }

std::string to_string(const std::vector<std::byte>& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace

TEST(Base64, EncodeEmpty) { EXPECT_EQ(B64Encode(sv_bytes("")), ""); }
TEST(Base64, Encode1) { EXPECT_EQ(B64Encode(sv_bytes("f")), "Zg=="); }
TEST(Base64, Encode2) { EXPECT_EQ(B64Encode(sv_bytes("fo")), "Zm8="); }
TEST(Base64, Encode3) { EXPECT_EQ(B64Encode(sv_bytes("foo")), "Zm9v"); }
TEST(Base64, Encode4) { EXPECT_EQ(B64Encode(sv_bytes("foob")), "Zm9vYg=="); }
TEST(Base64, Encode6) { EXPECT_EQ(B64Encode(sv_bytes("foobar")), "Zm9vYmFy"); }

TEST(Base64, EncodeHighBytes) {
  const std::vector<std::byte> data{std::byte{0xFF}, std::byte{0xFE}, std::byte{0x00}, std::byte{0x80}};
  EXPECT_EQ(B64Encode(data), "//4AgA==");
}

TEST(Base64, EncodedLen) {
  EXPECT_EQ(B64EncodedLen(0), 0U);
  EXPECT_EQ(B64EncodedLen(1), 4U);
  EXPECT_EQ(B64EncodedLen(3), 4U);
  EXPECT_EQ(B64EncodedLen(4), 8U);
  static_assert(B64EncodedLen(5U * 1024U * 1024U) == 6990508U);
}

TEST(Base64, Decode) {
  EXPECT_EQ(to_string(B64Decode("")), "");
  EXPECT_EQ(to_string(B64Decode("Zg==")), "f");
  EXPECT_EQ(to_string(B64Decode("Zm9vYmE=")), "fooba");
  EXPECT_EQ(to_string(B64Decode("Zm9vYmFy")), "foobar");
}

TEST(Base64, DecodeWithWhitespace) {
  EXPECT_EQ(to_string(B64Decode("Zm9v YmFy")), "foobar");
  EXPECT_EQ(to_string(B64Decode("Zm9v\r\nYmFy")), "foobar");
}

TEST(Base64, DecodeNoPadding) { EXPECT_EQ(to_string(B64Decode("Zm8")), "fo"); }

TEST(Base64, DecodeInvalidCharacter) {
  EXPECT_THROW((void)B64Decode("Zm9v@YmFy"), std::invalid_argument);
  EXPECT_THROW((void)B64Decode("Zm9v-YmFy"), std::invalid_argument);
}

TEST(Base64, BinaryRoundTrip) {
  std::vector<std::byte> data(1021);
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    data[pos] = static_cast<std::byte>((pos * 131U) & 0xFFU);
  }
  EXPECT_EQ(B64Decode(B64Encode(data)), data);
}

}  // namespace logwire
