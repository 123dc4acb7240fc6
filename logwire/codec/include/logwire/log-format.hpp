#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace logwire {

// Binary layout of an encoded log buffer:
//   magic(4) | version(1) | flags(1) | entryCount(4,BE) | tableOffset(4,BE) | dataOffset(4,BE) | firstTimestamp(8,BE)
//   | stringCount(varint) | (strLen(varint) strBytes)*
//   | entry*
// entry: delta(2 or 5) | deviceIdx(varint) | signalIdx(varint) | valueTag(1) | valueBytes(0..n)
namespace logformat {

inline constexpr std::array<std::byte, 4> kMagic{std::byte{'L'}, std::byte{'L'}, std::byte{'O'}, std::byte{'G'}};
inline constexpr uint8_t kVersion = 1;
inline constexpr uint8_t kFlags = 0;

inline constexpr std::size_t kHeaderSize = 4 + 1 + 1 + 4 + 4 + 4 + 8;

// A delta in [0, kShortDeltaLimit) is stored on 2 bytes big-endian.
// Any other delta is stored as kWideDeltaMarker followed by the int32 two's complement value, big-endian.
// Short deltas whose high byte would be 0xFF are stored in the wide form so that the marker stays unambiguous.
inline constexpr std::byte kWideDeltaMarker{0xFF};
inline constexpr int64_t kShortDeltaLimit = 0xFF00;
inline constexpr std::size_t kShortDeltaSize = 2;
inline constexpr std::size_t kWideDeltaSize = 5;

inline constexpr uint32_t kMaxVarint = (1U << 28) - 1U;
inline constexpr std::size_t kMaxVarintBytes = 4;

enum class ValueTag : uint8_t {
  BoolFalse = 0,
  BoolTrue = 1,
  Int8 = 2,
  Int16 = 3,
  Int32 = 4,
  StringIndex = 5,
  StringRaw = 6,
};

}  // namespace logformat

}  // namespace logwire
