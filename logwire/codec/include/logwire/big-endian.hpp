#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>
#include <vector>

namespace logwire {

template <std::unsigned_integral T>
void AppendBigEndian(T value, std::vector<std::byte>& out) {
  for (std::size_t shift = sizeof(T) * 8U; shift != 0;) {
    shift -= 8U;
    out.push_back(static_cast<std::byte>((value >> shift) & 0xFFU));
  }
}

template <std::unsigned_integral T>
void WriteBigEndian(T value, std::byte* out) {
  for (std::size_t pos = sizeof(T); pos != 0;) {
    --pos;
    out[pos] = static_cast<std::byte>(value & 0xFFU);
    if constexpr (sizeof(T) > 1) {
      value >>= 8U;
    }
  }
}

// Read a big-endian unsigned integer from the first sizeof(T) bytes of 'data'. Caller checks the size.
template <std::unsigned_integral T>
[[nodiscard]] T ReadBigEndian(std::span<const std::byte> data) noexcept {
  T value = 0;
  for (std::size_t pos = 0; pos < sizeof(T); ++pos) {
    if constexpr (sizeof(T) > 1) {
      value <<= 8U;
    }
    value |= static_cast<T>(data[pos]);
  }
  return value;
}

}  // namespace logwire
