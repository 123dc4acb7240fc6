#include "logwire/payload-compression.hpp"

#include <cstddef>
#include <exception>
#include <span>
#include <utility>

#include "logwire/compression-config.hpp"
#include "logwire/encoding.hpp"
#include "logwire/log.hpp"
#include "logwire/zlib-encoder.hpp"
#include "logwire/zlib-format.hpp"

namespace logwire {

PreparedPayload PreparePayload(std::span<const std::byte> original, const CompressionConfig& config) {
  PreparedPayload payload;
  payload.original = original;
  if (!config.enabled) {
    return payload;
  }

  try {
    auto compressed = ZlibEncoder(ZlibFormat::gzip, config).encodeFull(original);
    const auto limit = static_cast<double>(original.size()) * config.maxCompressedRatio;
    if (static_cast<double>(compressed.size()) < limit) {
      log::info("Compressed payload: {} -> {} bytes", original.size(), compressed.size());
      payload.compressed = std::move(compressed);
      payload.encoding = Encoding::gzip;
    } else {
      log::debug("Compression not worth it ({} -> {} bytes), sending as is", original.size(), compressed.size());
    }
  } catch (const std::exception& ex) {
    log::warn("Compression failed, sending uncompressed: {}", ex.what());
  }
  return payload;
}

}  // namespace logwire
