#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "logwire/compression-config.hpp"
#include "logwire/zlib-decoder.hpp"
#include "logwire/zlib-encoder.hpp"
#include "logwire/zlib-format.hpp"

namespace logwire {

namespace {

std::vector<std::byte> RepetitiveData(std::size_t size) {
  static constexpr std::string_view kLine = "2024-01-01 10:00:00.000 [Info] [PLC_01] [IO:Motor.Run] (Boolean) : ON\n";
  std::vector<std::byte> data(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    data[pos] = static_cast<std::byte>(kLine[pos % kLine.size()]);
  }
  return data;
}

std::vector<std::byte> RandomData(std::size_t size) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::byte> data(size);
  for (auto& byte : data) {
    byte = static_cast<std::byte>(dist(gen));
  }
  return data;
}

}  // namespace

class ZlibEncoderDecoderTest : public ::testing::TestWithParam<ZlibFormat> {};

INSTANTIATE_TEST_SUITE_P(Variants, ZlibEncoderDecoderTest,
                         ::testing::Values(ZlibFormat::gzip, ZlibFormat::deflate));

TEST_P(ZlibEncoderDecoderTest, RepetitiveDataShrinks) {
  const auto data = RepetitiveData(256UL * 1024UL);
  const auto compressed = ZlibEncoder(GetParam()).encodeFull(data);
  EXPECT_LT(compressed.size(), data.size() / 10);
  EXPECT_EQ(ZlibDecoder::Decompress(compressed, GetParam()), data);
}

TEST_P(ZlibEncoderDecoderTest, RandomDataAndSmallChunks) {
  const auto data = RandomData(100000);
  CompressionConfig cfg;
  cfg.withZlibLevel(CompressionConfig::Zlib::kMaxLevel);
  const auto compressed = ZlibEncoder(GetParam(), cfg).encodeFull(data);
  EXPECT_EQ(ZlibDecoder::Decompress(compressed, GetParam(), 0, 7), data);
}

TEST_P(ZlibEncoderDecoderTest, EmptyInput) {
  const auto compressed = ZlibEncoder(GetParam()).encodeFull({});
  EXPECT_FALSE(compressed.empty());
  EXPECT_TRUE(ZlibDecoder::Decompress(compressed, GetParam()).empty());
}

TEST_P(ZlibEncoderDecoderTest, DecompressLimit) {
  const auto data = RepetitiveData(10000);
  const auto compressed = ZlibEncoder(GetParam()).encodeFull(data);
  EXPECT_THROW((void)ZlibDecoder::Decompress(compressed, GetParam(), 9999), std::runtime_error);
  EXPECT_EQ(ZlibDecoder::Decompress(compressed, GetParam(), 10001), data);
}

TEST_P(ZlibEncoderDecoderTest, TruncatedOrCorruptedInputThrows) {
  const auto data = RandomData(5000);
  auto compressed = ZlibEncoder(GetParam()).encodeFull(data);
  EXPECT_THROW((void)ZlibDecoder::Decompress(std::span<const std::byte>(compressed).first(compressed.size() / 2),
                                             GetParam()),
               std::runtime_error);
  EXPECT_THROW((void)ZlibDecoder::Decompress({}, GetParam()), std::runtime_error);

  auto trailing = compressed;
  trailing.push_back(std::byte{0});
  EXPECT_THROW((void)ZlibDecoder::Decompress(trailing, GetParam()), std::runtime_error);

  compressed[0] = ~compressed[0];
  EXPECT_THROW((void)ZlibDecoder::Decompress(compressed, GetParam()), std::runtime_error);
}

TEST(ZlibEncoderTest, GzipHeaderMagic) {
  const auto compressed = ZlibEncoder(ZlibFormat::gzip).encodeFull(RepetitiveData(100));
  ASSERT_GE(compressed.size(), 2U);
  EXPECT_EQ(compressed[0], std::byte{0x1F});
  EXPECT_EQ(compressed[1], std::byte{0x8B});
}

TEST(ZlibEncoderTest, DeflateUsesZlibWrapper) {
  const auto compressed = ZlibEncoder(ZlibFormat::deflate).encodeFull(RepetitiveData(100));
  ASSERT_GE(compressed.size(), 2U);
  EXPECT_EQ(compressed[0], std::byte{0x78});
  EXPECT_THROW((void)ZlibDecoder::Decompress(compressed, ZlibFormat::gzip), std::runtime_error);
  EXPECT_EQ(ZlibDecoder::Decompress(compressed, ZlibFormat::deflate), RepetitiveData(100));
}

TEST(ZlibFormatTest, WindowBitsAndName) {
  static_assert(ZlibWindowBits(ZlibFormat::deflate) == MAX_WBITS);
  static_assert(ZlibWindowBits(ZlibFormat::gzip) == MAX_WBITS + 16);
  EXPECT_EQ(ZlibFormatName(ZlibFormat::gzip), "gzip");
  EXPECT_EQ(ZlibFormatName(ZlibFormat::deflate), "deflate");
}

TEST(ZlibEncoderTest, InvalidLevelThrowsAtInit) {
  CompressionConfig cfg;
  cfg.zlib.level = 42;
  EXPECT_THROW((void)ZlibEncoder(ZlibFormat::gzip, cfg).encodeFull(RepetitiveData(10)), std::runtime_error);
}

}  // namespace logwire
