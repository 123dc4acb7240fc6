#include "logwire/payload-compression.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <random>
#include <stdexcept>
#include <vector>

#include "logwire/compression-config.hpp"
#include "logwire/encoding.hpp"
#include "logwire/zlib-decoder.hpp"
#include "logwire/zlib-format.hpp"

namespace logwire {

namespace {

std::vector<std::byte> Repetitive(std::size_t size) {
  std::vector<std::byte> data(size);
  for (std::size_t pos = 0; pos < size; ++pos) {
    data[pos] = static_cast<std::byte>('a' + (pos % 7));
  }
  return data;
}

std::vector<std::byte> Random(std::size_t size) {
  std::mt19937 gen(7);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<std::byte> data(size);
  for (auto& byte : data) {
    byte = static_cast<std::byte>(dist(gen));
  }
  return data;
}

}  // namespace

TEST(PayloadCompressionTest, CompressibleDataIsGzipped) {
  const auto data = Repetitive(100000);
  const auto payload = PreparePayload(data, CompressionConfig{});
  EXPECT_EQ(payload.encoding, Encoding::gzip);
  EXPECT_LT(payload.bytes().size(), data.size() / 2);
  EXPECT_EQ(ZlibDecoder::Decompress(payload.bytes(), ZlibFormat::gzip), data);
}

TEST(PayloadCompressionTest, IncompressibleDataIsSentAsIs) {
  const auto data = Random(100000);
  const auto payload = PreparePayload(data, CompressionConfig{});
  EXPECT_EQ(payload.encoding, Encoding::none);
  EXPECT_TRUE(payload.compressed.empty());
  EXPECT_EQ(payload.bytes().data(), data.data());
  EXPECT_EQ(payload.bytes().size(), data.size());
}

TEST(PayloadCompressionTest, RatioThresholdIsStrict) {
  const auto data = Repetitive(100000);
  // A ratio so small that even a very good compression is rejected.
  CompressionConfig cfg;
  cfg.withMaxCompressedRatio(1e-6);
  EXPECT_EQ(PreparePayload(data, cfg).encoding, Encoding::none);
}

TEST(PayloadCompressionTest, EmptyPayloadIsNeverCompressed) {
  const std::vector<std::byte> data;
  const auto payload = PreparePayload(data, CompressionConfig{});
  EXPECT_EQ(payload.encoding, Encoding::none);
  EXPECT_TRUE(payload.bytes().empty());
}

TEST(PayloadCompressionTest, DisabledCompression) {
  const auto data = Repetitive(100000);
  CompressionConfig cfg;
  cfg.withEnabled(false);
  EXPECT_EQ(PreparePayload(data, cfg).encoding, Encoding::none);
}

TEST(PayloadCompressionTest, CompressionFailureFallsBackToOriginal) {
  const auto data = Repetitive(1000);
  CompressionConfig cfg;
  cfg.zlib.level = 42;  // rejected by deflateInit2
  const auto payload = PreparePayload(data, cfg);
  EXPECT_EQ(payload.encoding, Encoding::none);
  EXPECT_EQ(payload.bytes().size(), data.size());
}

TEST(CompressionConfigTest, Validate) {
  CompressionConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  cfg.withZlibLevel(CompressionConfig::Zlib::kMaxLevel);
  EXPECT_NO_THROW(cfg.validate());
  cfg.withZlibLevel(12);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withZlibLevel(CompressionConfig::Zlib::kDefaultLevel).withMaxCompressedRatio(0.0);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withMaxCompressedRatio(1.5);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
  cfg.withMaxCompressedRatio(1.0);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(EncodingTest, Names) {
  EXPECT_EQ(GetEncodingStr(Encoding::gzip), "gzip");
  EXPECT_EQ(GetEncodingStr(Encoding::none), "none");
  EXPECT_EQ(EncodingFromStr("gzip"), Encoding::gzip);
  EXPECT_EQ(EncodingFromStr(""), Encoding::none);
  EXPECT_FALSE(EncodingFromStr("br").has_value());
}

}  // namespace logwire
