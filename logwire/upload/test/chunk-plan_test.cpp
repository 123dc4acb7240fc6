#include "logwire/chunk-plan.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace logwire {

TEST(ChunkPlan, NumberOfChunksIsCeilOfRatio) {
  EXPECT_EQ(ChunkPlan(0, 10).nbChunks(), 0U);
  EXPECT_EQ(ChunkPlan(1, 10).nbChunks(), 1U);
  EXPECT_EQ(ChunkPlan(10, 10).nbChunks(), 1U);
  EXPECT_EQ(ChunkPlan(11, 10).nbChunks(), 2U);
  EXPECT_EQ(ChunkPlan(12UL * 1024 * 1024, 5UL * 1024 * 1024).nbChunks(), 3U);
}

TEST(ChunkPlan, ChunksCoverThePayloadInOrder) {
  std::vector<std::byte> payload(23);
  for (std::size_t pos = 0; pos < payload.size(); ++pos) {
    payload[pos] = static_cast<std::byte>(pos);
  }
  const ChunkPlan plan(payload.size(), 10);
  ASSERT_EQ(plan.nbChunks(), 3U);

  std::vector<std::byte> reassembled;
  for (uint32_t chunkIndex = 0; chunkIndex < plan.nbChunks(); ++chunkIndex) {
    const auto chunk = plan.chunk(payload, chunkIndex);
    EXPECT_EQ(chunk.size(), chunkIndex < 2 ? 10U : 3U);
    EXPECT_EQ(plan.isLast(chunkIndex), chunkIndex == 2);
    reassembled.insert(reassembled.end(), chunk.begin(), chunk.end());
  }
  EXPECT_EQ(reassembled, payload);
}

TEST(ChunkPlan, InvalidUsage) {
  EXPECT_THROW(ChunkPlan(10, 0), std::invalid_argument);
  EXPECT_THROW(ChunkPlan(1UL << 40, 1), std::length_error);

  std::vector<std::byte> payload(5);
  const ChunkPlan plan(payload.size(), 2);
  EXPECT_THROW((void)plan.chunk(payload, 3), std::out_of_range);
  EXPECT_THROW((void)plan.chunk(std::span<const std::byte>(payload).first(4), 0), std::out_of_range);
}

}  // namespace logwire
