#include "logwire/zlib-encoder.hpp"

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

// zlib default memory level for deflate.
constexpr int kMemLevel = 8;

// z_stream initialized for compression, released on scope exit.
class DeflateStream {
 public:
  DeflateStream(ZlibFormat format, int level) {
    const auto ret = deflateInit2(&_stream, level, Z_DEFLATED, ZlibWindowBits(format), kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
      throw std::runtime_error(fmt::format("Unable to initialize {} compression at level {}: zlib error {}",
                                           ZlibFormatName(format), level, ret));
    }
  }

  DeflateStream(const DeflateStream&) = delete;
  DeflateStream& operator=(const DeflateStream&) = delete;

  // Z_DATA_ERROR only tells that the stream was abandoned before Z_STREAM_END (an exception unwinding).
  ~DeflateStream() {
    if (deflateEnd(&_stream) == Z_STREAM_ERROR) {
      log::error("deflateEnd found an inconsistent stream state");
    }
  }

  z_stream& get() noexcept { return _stream; }

 private:
  z_stream _stream{};
};

}  // namespace

std::vector<std::byte> ZlibEncoder::encodeFull(std::span<const std::byte> data) const {
  static constexpr std::size_t kMaxAvail = std::numeric_limits<uInt>::max();

  DeflateStream deflateStream(_format, _level);
  z_stream& zstream = deflateStream.get();

  std::vector<std::byte> out;
  out.resize(static_cast<std::size_t>(deflateBound(&zstream, static_cast<uLong>(data.size()))));
  std::size_t outSize = 0;

  // avail_in and avail_out are 32 bits wide, feed zlib by slices.
  int ret = Z_OK;
  do {
    const auto inSlice = std::min(data.size(), kMaxAvail);
    zstream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
    zstream.avail_in = static_cast<uInt>(inSlice);
    data = data.subspan(inSlice);
    const int flush = data.empty() ? Z_FINISH : Z_NO_FLUSH;

    do {
      if (out.size() == outSize) {
        out.resize(out.size() * 2U + 64U);
      }
      const auto availableCapacity = std::min(out.size() - outSize, kMaxAvail);
      zstream.next_out = reinterpret_cast<Bytef*>(out.data() + outSize);
      zstream.avail_out = static_cast<uInt>(availableCapacity);

      ret = deflate(&zstream, flush);
      if (ret == Z_STREAM_ERROR) {
        throw std::runtime_error(fmt::format("Error {} during {} compression", ret, ZlibFormatName(_format)));
      }
      outSize += availableCapacity - zstream.avail_out;
      if (ret == Z_STREAM_END) {
        break;
      }
    } while (zstream.avail_out == 0 || zstream.avail_in != 0);
  } while (!data.empty());

  if (ret != Z_STREAM_END) {
    throw std::runtime_error(fmt::format("Error {} during {} compression: stream not terminated", ret,
                                         ZlibFormatName(_format)));
  }
  out.resize(outSize);
  return out;
}

}  // namespace logwire
