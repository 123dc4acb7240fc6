#pragma once

#include <cstddef>
#include <string>

namespace logwire {

// Human readable size reduction summary, for instance "87.5% (8.00MB -> 1.00MB)".
// An original size of 0 gives a 0.0% reduction.
[[nodiscard]] std::string CompressionRatio(std::size_t originalSize, std::size_t encodedSize);

}  // namespace logwire
