#include "logwire/base64.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace logwire {

namespace {

constexpr std::string_view kB64Table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kB64NbBits = 6;
constexpr uint32_t kMask6 = (1U << kB64NbBits) - 1U;
constexpr unsigned char kInvalid = 64;

constexpr auto kReverseTable = [] {
  std::array<unsigned char, 256> table{};
  table.fill(kInvalid);
  for (std::size_t pos = 0; pos < kB64Table.size(); ++pos) {
    table[static_cast<unsigned char>(kB64Table[pos])] = static_cast<unsigned char>(pos);
  }
  return table;
}();

constexpr bool IsSkippable(char ch) noexcept {
  return ch == '=' || ch == ' ' || ch == '\n' || ch == '\r' || ch == '\t';
}

}  // namespace

void B64Encode(std::span<const std::byte> binData, char* out) {
  char* const endOut = out + B64EncodedLen(binData.size());
  int bitsCollected = 0;
  uint32_t accumulator = 0;

  for (std::byte byte : binData) {
    accumulator = (accumulator << 8) | static_cast<uint8_t>(byte);
    bitsCollected += 8;
    while (bitsCollected >= kB64NbBits) {
      bitsCollected -= kB64NbBits;
      *out++ = kB64Table[(accumulator >> bitsCollected) & kMask6];
    }
  }
  if (bitsCollected > 0) {
    accumulator <<= kB64NbBits - bitsCollected;
    *out++ = kB64Table[accumulator & kMask6];
  }
  while (out != endOut) {
    *out++ = '=';
  }
}

std::string B64Encode(std::span<const std::byte> binData) {
  std::string ret(B64EncodedLen(binData.size()), '\0');
  B64Encode(binData, ret.data());
  return ret;
}

std::vector<std::byte> B64Decode(std::string_view ascData) {
  std::vector<std::byte> ret;
  ret.reserve((ascData.size() * 3) / 4);
  int bitsCollected = 0;
  uint32_t accumulator = 0;

  for (char ch : ascData) {
    if (IsSkippable(ch)) {
      continue;
    }
    const auto sextet = kReverseTable[static_cast<unsigned char>(ch)];
    if (sextet == kInvalid) {
      throw std::invalid_argument("Illegal character detected for a base 64 encoded string");
    }
    accumulator = (accumulator << kB64NbBits) | sextet;
    bitsCollected += kB64NbBits;
    if (bitsCollected >= 8) {
      bitsCollected -= 8;
      ret.push_back(static_cast<std::byte>((accumulator >> bitsCollected) & 0xFFU));
    }
  }
  return ret;
}

}  // namespace logwire
