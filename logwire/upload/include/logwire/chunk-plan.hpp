#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace logwire {

// Split of a payload into fixed size chunks, the last one holding the remainder.
class ChunkPlan {
 public:
  // Throws std::invalid_argument if chunkSize is 0, std::length_error if more than 2^32 - 1 chunks are needed.
  ChunkPlan(std::size_t payloadSize, std::size_t chunkSize);

  // ceil(payloadSize / chunkSize). An empty payload has no chunk.
  [[nodiscard]] uint32_t nbChunks() const noexcept { return _nbChunks; }

  [[nodiscard]] std::size_t payloadSize() const noexcept { return _payloadSize; }

  [[nodiscard]] bool isLast(uint32_t chunkIndex) const noexcept { return chunkIndex + 1U == _nbChunks; }

  // Bytes of chunk 'chunkIndex' within 'payload' (of size payloadSize()).
  [[nodiscard]] std::span<const std::byte> chunk(std::span<const std::byte> payload, uint32_t chunkIndex) const;

 private:
  std::size_t _payloadSize;
  std::size_t _chunkSize;
  uint32_t _nbChunks;
};

}  // namespace logwire
