#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "logwire/zlib-format.hpp"

namespace logwire {

// Full-buffer zlib / gzip inflate helper.
class ZlibDecoder {
 public:
  static constexpr std::size_t kDefaultDecoderChunkSize = 64UL * 1024UL;

  // Decompress 'input' entirely. A maxDecompressedBytes of 0 means no limit.
  // Throws std::runtime_error if the stream is corrupted, truncated, followed by garbage or exceeds the limit.
  [[nodiscard]] static std::vector<std::byte> Decompress(std::span<const std::byte> input,
                                                         ZlibFormat format,
                                                         std::size_t maxDecompressedBytes = 0,
                                                         std::size_t decoderChunkSize = kDefaultDecoderChunkSize);
};

}  // namespace logwire
