#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string_view>

namespace logwire {

// Receives upload progress as a percentage in [0, 100] and a short stage description.
// Chunk progress is reported when a chunk is handed to the session, not when the server stored it.
// Server processing updates are reported from the session thread.
using ProgressCallback = std::function<void(int progress, std::string_view stage)>;

namespace progress {

inline constexpr int kPreparing = 0;
inline constexpr int kUploading = 5;
inline constexpr int kProcessing = 90;
inline constexpr int kComplete = 100;

// Progress once chunk 'chunkIndex' of 'nbChunks' has been sent: spread over [5, 85].
[[nodiscard]] inline int AfterChunk(uint32_t chunkIndex, uint32_t nbChunks) {
  return static_cast<int>(std::lround(static_cast<double>(chunkIndex + 1U) / static_cast<double>(nbChunks) * 80.0)) +
         kUploading;
}

// Server side processing percentage mapped to [90, 99].
[[nodiscard]] inline int FromServerProcessing(double serverProgress) {
  return std::min(99, kProcessing + static_cast<int>(std::lround(serverProgress / 10.0)));
}

}  // namespace progress

}  // namespace logwire
