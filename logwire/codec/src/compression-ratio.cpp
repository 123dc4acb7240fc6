#include "logwire/compression-ratio.hpp"

#include <cstddef>
#include <string>

#include "logwire/fmt.hpp"

namespace logwire {

std::string CompressionRatio(std::size_t originalSize, std::size_t encodedSize) {
  static constexpr double kMiB = 1024.0 * 1024.0;
  double reduction = 0.0;
  if (originalSize != 0) {
    reduction = (1.0 - (static_cast<double>(encodedSize) / static_cast<double>(originalSize))) * 100.0;
  }
  return fmt::format("{:.1f}% ({:.2f}MB -> {:.2f}MB)", reduction, static_cast<double>(originalSize) / kMiB,
                     static_cast<double>(encodedSize) / kMiB);
}

}  // namespace logwire
