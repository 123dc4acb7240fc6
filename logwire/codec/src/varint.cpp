#include "logwire/varint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include "logwire/fmt.hpp"
#include "logwire/log-format.hpp"

namespace logwire {

namespace {

constexpr int kPayloadBits = 7;
constexpr uint32_t kPayloadMask = 0x7F;
constexpr std::byte kContinuationBit{0x80};

}  // namespace

std::size_t VarintEncodedLen(uint32_t value) {
  if (value > logformat::kMaxVarint) {
    throw std::length_error(
        fmt::format("Value {} exceeds varint limit {}", value, logformat::kMaxVarint));
  }
  std::size_t nbBytes = 1;
  for (value >>= kPayloadBits; value != 0; value >>= kPayloadBits) {
    ++nbBytes;
  }
  return nbBytes;
}

void AppendVarint(uint32_t value, std::vector<std::byte>& out) {
  const auto nbBytes = VarintEncodedLen(value);
  for (auto groupPos = nbBytes; groupPos > 1; --groupPos) {
    const auto shift = static_cast<int>(groupPos - 1) * kPayloadBits;
    out.push_back(static_cast<std::byte>((value >> shift) & kPayloadMask) | kContinuationBit);
  }
  out.push_back(static_cast<std::byte>(value & kPayloadMask));
}

std::optional<VarintReadResult> ReadVarint(std::span<const std::byte> data) noexcept {
  uint32_t value = 0;
  for (std::size_t pos = 0; pos < data.size() && pos < logformat::kMaxVarintBytes; ++pos) {
    const auto byte = data[pos];
    value = (value << kPayloadBits) | (static_cast<uint32_t>(byte) & kPayloadMask);
    if ((byte & kContinuationBit) == std::byte{0}) {
      return VarintReadResult{value, pos + 1};
    }
  }
  return std::nullopt;
}

}  // namespace logwire
