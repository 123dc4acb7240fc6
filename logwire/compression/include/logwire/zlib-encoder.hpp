#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "logwire/compression-config.hpp"
#include "logwire/zlib-format.hpp"

namespace logwire {

class ZlibEncoder {
 public:
  explicit ZlibEncoder(ZlibFormat format, const CompressionConfig& cfg = {})
      : _level(cfg.zlib.level), _format(format) {}

  // Compress the whole 'data' in one go. Throws std::runtime_error on zlib failure.
  [[nodiscard]] std::vector<std::byte> encodeFull(std::span<const std::byte> data) const;

 private:
  int8_t _level;
  ZlibFormat _format;
};

}  // namespace logwire
