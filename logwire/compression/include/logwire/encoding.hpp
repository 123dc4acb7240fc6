#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace logwire {

// Transfer encoding of an uploaded payload.
enum class Encoding : std::uint8_t {
  gzip,
  none,
};

// Wire name of the encoding, as carried in upload:init and upload:complete payloads.
constexpr std::string_view GetEncodingStr(Encoding enc) {
  switch (enc) {
    case Encoding::gzip:
      return "gzip";
    case Encoding::none:
      return "none";
    default:
      return "unknown";
  }
}

constexpr std::optional<Encoding> EncodingFromStr(std::string_view str) {
  if (str == "gzip") {
    return Encoding::gzip;
  }
  if (str == "none" || str.empty()) {
    return Encoding::none;
  }
  return std::nullopt;
}

}  // namespace logwire
