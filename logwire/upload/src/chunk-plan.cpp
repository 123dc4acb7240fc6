#include "logwire/chunk-plan.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>

#include "logwire/fmt.hpp"

namespace logwire {

namespace {

uint32_t ComputeNbChunks(std::size_t payloadSize, std::size_t chunkSize) {
  if (chunkSize == 0) {
    throw std::invalid_argument("Chunk size should be strictly positive");
  }
  const std::size_t nbChunks = (payloadSize / chunkSize) + (payloadSize % chunkSize == 0 ? 0 : 1);
  if (nbChunks > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error(fmt::format("Payload of {} bytes needs too many chunks of {} bytes", payloadSize, chunkSize));
  }
  return static_cast<uint32_t>(nbChunks);
}

}  // namespace

ChunkPlan::ChunkPlan(std::size_t payloadSize, std::size_t chunkSize)
    : _payloadSize(payloadSize), _chunkSize(chunkSize), _nbChunks(ComputeNbChunks(payloadSize, chunkSize)) {}

std::span<const std::byte> ChunkPlan::chunk(std::span<const std::byte> payload, uint32_t chunkIndex) const {
  if (chunkIndex >= _nbChunks || payload.size() != _payloadSize) {
    throw std::out_of_range(fmt::format("Invalid chunk {} of {}", chunkIndex, _nbChunks));
  }
  const std::size_t offset = static_cast<std::size_t>(chunkIndex) * _chunkSize;
  return payload.subspan(offset, std::min(_chunkSize, _payloadSize - offset));
}

}  // namespace logwire
