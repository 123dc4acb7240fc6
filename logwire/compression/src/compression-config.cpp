#include "logwire/compression-config.hpp"

#include <stdexcept>

#include "logwire/fmt.hpp"

namespace logwire {

void CompressionConfig::validate() const {
  if (zlib.level != Zlib::kDefaultLevel && (zlib.level < Zlib::kMinLevel || zlib.level > Zlib::kMaxLevel)) {
    throw std::invalid_argument(fmt::format("Invalid ZLIB compression level {}", zlib.level));
  }
  if (!(maxCompressedRatio > 0.0 && maxCompressedRatio <= 1.0)) {
    throw std::invalid_argument(fmt::format("Invalid max compressed ratio {}, should be in ]0, 1]", maxCompressedRatio));
  }
}

}  // namespace logwire
