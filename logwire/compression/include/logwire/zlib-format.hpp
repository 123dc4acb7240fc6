#pragma once

#include <zlib.h>

#include <cstdint>
#include <string_view>

namespace logwire {

// Container around a deflate stream.
enum class ZlibFormat : int8_t { gzip, deflate };

// windowBits argument of deflateInit2 / inflateInit2. Adding 16 selects the gzip wrapper over the zlib one.
constexpr int ZlibWindowBits(ZlibFormat format) { return format == ZlibFormat::gzip ? MAX_WBITS + 16 : MAX_WBITS; }

constexpr std::string_view ZlibFormatName(ZlibFormat format) {
  return format == ZlibFormat::gzip ? "gzip" : "deflate";
}

}  // namespace logwire
