#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "logwire/compression-config.hpp"
#include "logwire/encoding.hpp"

namespace logwire {

// Payload ready to be chunked: either the gzip compressed form or a view on the original bytes.
struct PreparedPayload {
  [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
    return encoding == Encoding::none ? original : std::span<const std::byte>(compressed);
  }

  std::span<const std::byte> original;
  std::vector<std::byte> compressed;  // empty unless encoding is gzip
  Encoding encoding{Encoding::none};
};

// Gzip the whole payload and keep the result only if it is small enough (see CompressionConfig).
// Compression failures are logged and fall back to the original bytes.
// 'original' must outlive the returned object.
[[nodiscard]] PreparedPayload PreparePayload(std::span<const std::byte> original, const CompressionConfig& config);

}  // namespace logwire
