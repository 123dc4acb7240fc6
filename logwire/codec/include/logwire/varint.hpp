#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace logwire {

// Number of bytes needed to store 'value' as a varint (7 payload bits per byte, most significant group first,
// continuation bit 0x80 set on every byte but the last).
// Throws std::length_error if value exceeds logformat::kMaxVarint.
[[nodiscard]] std::size_t VarintEncodedLen(uint32_t value);

// Append the varint representation of 'value' to 'out'.
// Throws std::length_error if value exceeds logformat::kMaxVarint.
void AppendVarint(uint32_t value, std::vector<std::byte>& out);

struct VarintReadResult {
  uint32_t value;
  std::size_t nbBytes;
};

// Read a varint at the beginning of 'data'.
// Returns std::nullopt if data is truncated or if the varint is longer than logformat::kMaxVarintBytes.
[[nodiscard]] std::optional<VarintReadResult> ReadVarint(std::span<const std::byte> data) noexcept;

}  // namespace logwire
