#include "logwire/varint.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include "logwire/log-format.hpp"

namespace logwire {

namespace {

std::vector<std::byte> Bytes(std::initializer_list<int> values) {
  std::vector<std::byte> ret;
  for (int val : values) {
    ret.push_back(static_cast<std::byte>(val));
  }
  return ret;
}

std::vector<std::byte> Encode(uint32_t value) {
  std::vector<std::byte> out;
  AppendVarint(value, out);
  return out;
}

}  // namespace

TEST(VarintTest, SingleByte) {
  EXPECT_EQ(Encode(0), Bytes({0x00}));
  EXPECT_EQ(Encode(1), Bytes({0x01}));
  EXPECT_EQ(Encode(127), Bytes({0x7F}));
}

TEST(VarintTest, MostSignificantGroupFirst) {
  EXPECT_EQ(Encode(128), Bytes({0x81, 0x00}));
  EXPECT_EQ(Encode(300), Bytes({0x82, 0x2C}));
  EXPECT_EQ(Encode(16383), Bytes({0xFF, 0x7F}));
  EXPECT_EQ(Encode(16384), Bytes({0x81, 0x80, 0x00}));
  EXPECT_EQ(Encode(2097152), Bytes({0x81, 0x80, 0x80, 0x00}));
  EXPECT_EQ(Encode(logformat::kMaxVarint), Bytes({0xFF, 0xFF, 0xFF, 0x7F}));
}

TEST(VarintTest, EncodedLen) {
  EXPECT_EQ(VarintEncodedLen(0), 1U);
  EXPECT_EQ(VarintEncodedLen(127), 1U);
  EXPECT_EQ(VarintEncodedLen(128), 2U);
  EXPECT_EQ(VarintEncodedLen(2097151), 3U);
  EXPECT_EQ(VarintEncodedLen(logformat::kMaxVarint), 4U);
}

TEST(VarintTest, ValueAboveLimitThrows) {
  std::vector<std::byte> out;
  EXPECT_THROW(AppendVarint(logformat::kMaxVarint + 1U, out), std::length_error);
  EXPECT_TRUE(out.empty());
}

TEST(VarintTest, Read) {
  const auto data = Bytes({0x82, 0x2C, 0x55});
  auto res = ReadVarint(data);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->value, 300U);
  EXPECT_EQ(res->nbBytes, 2U);

  for (uint32_t value : {0U, 127U, 128U, 16384U, 1234567U, logformat::kMaxVarint}) {
    const auto encoded = Encode(value);
    res = ReadVarint(encoded);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->value, value);
    EXPECT_EQ(res->nbBytes, encoded.size());
  }
}

TEST(VarintTest, ReadTruncatedOrTooLong) {
  EXPECT_FALSE(ReadVarint({}).has_value());
  EXPECT_FALSE(ReadVarint(Bytes({0x81})).has_value());
  EXPECT_FALSE(ReadVarint(Bytes({0x81, 0x80, 0x80, 0x80, 0x00})).has_value());
}

}  // namespace logwire
