#pragma once

#include <zlib.h>

#include <cstdint>

namespace logwire {

// Whole-payload compression applied before chunking an upload.
struct CompressionConfig {
  static constexpr double kDefaultMaxCompressedRatio = 0.95;

  void validate() const;

  CompressionConfig& withEnabled(bool value) {
    enabled = value;
    return *this;
  }

  CompressionConfig& withZlibLevel(int8_t level) {
    zlib.level = level;
    return *this;
  }

  CompressionConfig& withMaxCompressedRatio(double ratio) {
    maxCompressedRatio = ratio;
    return *this;
  }

  struct Zlib {
    static constexpr int8_t kDefaultLevel = Z_DEFAULT_COMPRESSION;
    static constexpr int8_t kMinLevel = Z_BEST_SPEED;
    static constexpr int8_t kMaxLevel = Z_BEST_COMPRESSION;

    int8_t level = kDefaultLevel;
  } zlib;

  // The compressed form is kept only if strictly smaller than maxCompressedRatio * original size.
  double maxCompressedRatio{kDefaultMaxCompressedRatio};

  // When false, payloads are always sent as is.
  bool enabled{true};
};

}  // namespace logwire
