#include "logwire/zlib-decoder.hpp"

#include <zconf.h>
#include <zlib.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/zlib-format.hpp"

namespace logwire {

namespace {

// z_stream initialized for decompression, released on scope exit.
class InflateStream {
 public:
  explicit InflateStream(ZlibFormat format) {
    const auto ret = inflateInit2(&_stream, ZlibWindowBits(format));
    if (ret != Z_OK) {
      throw std::runtime_error(
          fmt::format("Unable to initialize {} decompression: zlib error {}", ZlibFormatName(format), ret));
    }
  }

  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;

  ~InflateStream() {
    if (inflateEnd(&_stream) != Z_OK) {
      log::error("inflateEnd found an inconsistent stream state");
    }
  }

  z_stream& get() noexcept { return _stream; }

 private:
  z_stream _stream{};
};

}  // namespace

std::vector<std::byte> ZlibDecoder::Decompress(std::span<const std::byte> input, ZlibFormat format,
                                               std::size_t maxDecompressedBytes, std::size_t decoderChunkSize) {
  static constexpr std::size_t kMaxAvail = std::numeric_limits<uInt>::max();
  if (maxDecompressedBytes == 0) {
    maxDecompressedBytes = std::numeric_limits<std::size_t>::max();
  }
  decoderChunkSize = std::max<std::size_t>(decoderChunkSize, 1);

  InflateStream inflateStream(format);
  z_stream& stream = inflateStream.get();

  std::vector<std::byte> out;
  std::size_t outSize = 0;
  while (true) {
    if (stream.avail_in == 0 && !input.empty()) {
      const auto inSlice = std::min(input.size(), kMaxAvail);
      stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
      stream.avail_in = static_cast<uInt>(inSlice);
      input = input.subspan(inSlice);
    }
    if (outSize == maxDecompressedBytes) {
      throw std::runtime_error(fmt::format("Decompressed size exceeds the limit of {} bytes", maxDecompressedBytes));
    }
    const auto capacity =
        std::min({std::max(decoderChunkSize, out.size()), maxDecompressedBytes - outSize, kMaxAvail});
    out.resize(outSize + capacity);
    stream.next_out = reinterpret_cast<Bytef*>(out.data() + outSize);
    stream.avail_out = static_cast<uInt>(capacity);

    const auto ret = inflate(&stream, Z_NO_FLUSH);
    outSize += capacity - stream.avail_out;
    if (ret == Z_STREAM_END) {
      if (stream.avail_in != 0 || !input.empty()) {
        throw std::runtime_error("Unexpected trailing data after the end of the compressed stream");
      }
      break;
    }
    if (ret == Z_BUF_ERROR && stream.avail_in == 0 && input.empty()) {
      throw std::runtime_error("Truncated compressed stream");
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      throw std::runtime_error(fmt::format("inflate failed with error {}", ret));
    }
  }
  out.resize(outSize);
  return out;
}

}  // namespace logwire
