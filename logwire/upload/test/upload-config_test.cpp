#include "logwire/upload-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "logwire/upload-progress.hpp"

namespace logwire {

TEST(UploadConfig, Defaults) {
  UploadConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.chunkSize, 5UL * 1024UL * 1024UL);
  EXPECT_EQ(config.ackTimeout, std::chrono::seconds{10});
  EXPECT_EQ(config.completeTimeout, std::chrono::seconds{120});
  EXPECT_EQ(config.metadataTimeout, std::chrono::seconds{30});
  EXPECT_EQ(config.pacingInterval, 5U);
  EXPECT_EQ(config.pacingDelay, std::chrono::milliseconds{10});
  EXPECT_DOUBLE_EQ(config.compression.maxCompressedRatio, 0.95);
}

TEST(UploadConfig, Invalid) {
  EXPECT_THROW(UploadConfig{}.withChunkSize(0).validate(), std::invalid_argument);
  EXPECT_THROW(UploadConfig{}.withAckTimeout(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(UploadConfig{}.withCompleteTimeout(std::chrono::milliseconds{-5}).validate(), std::invalid_argument);
  EXPECT_THROW(UploadConfig{}.withMetadataTimeout(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(UploadConfig{}.withPacing(5, std::chrono::milliseconds{-1}).validate(), std::invalid_argument);
  EXPECT_THROW(UploadConfig{}.withCompression(CompressionConfig{}.withMaxCompressedRatio(1.5)).validate(),
               std::invalid_argument);
  EXPECT_NO_THROW(UploadConfig{}.withPacing(0, std::chrono::milliseconds{0}).validate());
}

TEST(UploadProgress, ChunkProgressSpansFiveToEightyFive) {
  EXPECT_EQ(progress::AfterChunk(0, 1), 85);
  EXPECT_EQ(progress::AfterChunk(0, 3), 32);
  EXPECT_EQ(progress::AfterChunk(1, 3), 58);
  EXPECT_EQ(progress::AfterChunk(2, 3), 85);
  EXPECT_EQ(progress::AfterChunk(0, 160), 6);
}

TEST(UploadProgress, ServerProcessingIsCappedBelowComplete) {
  EXPECT_EQ(progress::FromServerProcessing(0.0), 90);
  EXPECT_EQ(progress::FromServerProcessing(50.0), 95);
  EXPECT_EQ(progress::FromServerProcessing(94.0), 99);
  EXPECT_EQ(progress::FromServerProcessing(100.0), 99);
}

}  // namespace logwire
