#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace logwire {

/// Number of characters of the padded base64 representation of 'binDataLen' bytes.
constexpr std::size_t B64EncodedLen(std::size_t binDataLen) { return ((binDataLen + 2) / 3) * 4; }

/// Encode binary data to padded base64 (RFC 4648 standard alphabet), writing exactly
/// B64EncodedLen(binData.size()) characters starting at 'out'.
void B64Encode(std::span<const std::byte> binData, char* out);

/// Encode binary data to a padded base64 string.
[[nodiscard]] std::string B64Encode(std::span<const std::byte> binData);

/// Decode a base64 string. Whitespace and padding characters are skipped.
/// Throws std::invalid_argument on characters outside the base64 alphabet.
[[nodiscard]] std::vector<std::byte> B64Decode(std::string_view ascData);

}  // namespace logwire
