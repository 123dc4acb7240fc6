#include "logwire/log-decoder.hpp"

#include <algorithm>
#include <cstddef>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "logwire/big-endian.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log-entry.hpp"
#include "logwire/log-format.hpp"
#include "logwire/varint.hpp"

namespace logwire {

namespace {

using logformat::ValueTag;

// Smallest possible entry: short delta, two 1-byte indexes and a boolean tag.
constexpr std::size_t kMinEntrySize = logformat::kShortDeltaSize + 3U;

class ByteReader {
 public:
  explicit ByteReader(std::span<const std::byte> data, std::size_t pos = 0) : _data(data), _pos(pos) {}

  [[nodiscard]] std::size_t pos() const noexcept { return _pos; }

  [[nodiscard]] std::size_t remaining() const noexcept { return _data.size() - _pos; }

  std::byte peek(std::string_view what) const {
    ensure(1, what);
    return _data[_pos];
  }

  std::byte readByte(std::string_view what) {
    ensure(1, what);
    return _data[_pos++];
  }

  template <std::unsigned_integral T>
  T readBigEndian(std::string_view what) {
    ensure(sizeof(T), what);
    const T value = ReadBigEndian<T>(_data.subspan(_pos));
    _pos += sizeof(T);
    return value;
  }

  uint32_t readVarint(std::string_view what) {
    const auto res = ReadVarint(_data.subspan(_pos));
    if (!res) {
      throw LogDecodeError(fmt::format("Invalid or truncated varint for {} at offset {}", what, _pos));
    }
    _pos += res->nbBytes;
    return res->value;
  }

  std::string readString(std::string_view what) {
    const auto len = readVarint(what);
    ensure(len, what);
    std::string str(reinterpret_cast<const char*>(_data.data() + _pos), len);
    _pos += len;
    return str;
  }

 private:
  void ensure(std::size_t nbBytes, std::string_view what) const {
    if (remaining() < nbBytes) {
      throw LogDecodeError(
          fmt::format("Truncated buffer reading {} at offset {} ({} bytes needed, {} available)", what, _pos, nbBytes,
                      remaining()));
    }
  }

  std::span<const std::byte> _data;
  std::size_t _pos;
};

LogHeader ReadHeader(ByteReader& reader) {
  for (std::byte expected : logformat::kMagic) {
    if (reader.readByte("magic") != expected) {
      throw LogDecodeError("Invalid magic, not an encoded log buffer");
    }
  }
  LogHeader header;
  header.version = static_cast<uint8_t>(reader.readByte("version"));
  if (header.version != logformat::kVersion) {
    throw LogDecodeError(fmt::format("Unsupported format version {}", header.version));
  }
  header.flags = static_cast<uint8_t>(reader.readByte("flags"));
  header.entryCount = reader.readBigEndian<uint32_t>("entry count");
  header.tableOffset = reader.readBigEndian<uint32_t>("table offset");
  header.dataOffset = reader.readBigEndian<uint32_t>("data offset");
  header.firstTimestamp = static_cast<int64_t>(reader.readBigEndian<uint64_t>("first timestamp"));

  if (header.tableOffset < logformat::kHeaderSize || header.dataOffset < header.tableOffset) {
    throw LogDecodeError(fmt::format("Inconsistent offsets (table {}, data {})", header.tableOffset, header.dataOffset));
  }
  return header;
}

int64_t ReadDelta(ByteReader& reader) {
  if (reader.peek("timestamp delta") == logformat::kWideDeltaMarker) {
    reader.readByte("timestamp delta");
    return static_cast<int32_t>(reader.readBigEndian<uint32_t>("wide timestamp delta"));
  }
  return reader.readBigEndian<uint16_t>("timestamp delta");
}

const std::string& LookupString(const std::vector<std::string>& strings, uint32_t idx, std::string_view what) {
  if (idx >= strings.size()) {
    throw LogDecodeError(fmt::format("{} index {} out of range (table has {} strings)", what, idx, strings.size()));
  }
  return strings[idx];
}

LogValue ReadValue(ByteReader& reader, const std::vector<std::string>& strings) {
  const auto tagPos = reader.pos();
  const auto tag = static_cast<ValueTag>(reader.readByte("value tag"));
  switch (tag) {
    case ValueTag::BoolFalse:
      return false;
    case ValueTag::BoolTrue:
      return true;
    case ValueTag::Int8:
      return static_cast<int32_t>(static_cast<int8_t>(reader.readBigEndian<uint8_t>("int8 value")));
    case ValueTag::Int16:
      return static_cast<int32_t>(static_cast<int16_t>(reader.readBigEndian<uint16_t>("int16 value")));
    case ValueTag::Int32:
      return static_cast<int32_t>(reader.readBigEndian<uint32_t>("int32 value"));
    case ValueTag::StringIndex:
      return LookupString(strings, reader.readVarint("string value index"), "String value");
    case ValueTag::StringRaw:
      return reader.readString("raw string value");
    default:
      throw LogDecodeError(fmt::format("Unknown value tag {} at offset {}", static_cast<int>(tag), tagPos));
  }
}

}  // namespace

DecodedLog DecodeLog(std::span<const std::byte> data) {
  DecodedLog decoded;
  ByteReader headerReader(data);
  decoded.header = ReadHeader(headerReader);
  const LogHeader& header = decoded.header;
  if (header.dataOffset > data.size()) {
    throw LogDecodeError(fmt::format("Data offset {} beyond buffer size {}", header.dataOffset, data.size()));
  }

  ByteReader tableReader(data.first(header.dataOffset), header.tableOffset);
  const auto nbStrings = tableReader.readVarint("string count");
  decoded.strings.reserve(std::min<std::size_t>(nbStrings, tableReader.remaining()));
  for (uint32_t strPos = 0; strPos < nbStrings; ++strPos) {
    decoded.strings.push_back(tableReader.readString("string table entry"));
  }
  if (tableReader.remaining() != 0) {
    throw LogDecodeError(fmt::format("String table ends at offset {} but data starts at offset {}", tableReader.pos(),
                                     header.dataOffset));
  }

  ByteReader reader(data, header.dataOffset);
  decoded.entries.reserve(std::min<std::size_t>(header.entryCount, reader.remaining() / kMinEntrySize));
  int64_t timestamp = header.firstTimestamp;
  for (uint32_t entryPos = 0; entryPos < header.entryCount; ++entryPos) {
    LogEntry& entry = decoded.entries.emplace_back();
    timestamp += ReadDelta(reader);
    entry.timestamp = timestamp;
    entry.deviceId = LookupString(decoded.strings, reader.readVarint("device index"), "Device");
    entry.signalName = LookupString(decoded.strings, reader.readVarint("signal index"), "Signal");
    entry.value = ReadValue(reader, decoded.strings);
  }
  decoded.encodedSize = reader.pos();
  return decoded;
}

std::vector<LogEntry> DecodeLogEntries(std::span<const std::byte> data) {
  if (data.empty()) {
    return {};
  }
  DecodedLog decoded = DecodeLog(data);
  if (decoded.encodedSize != data.size()) {
    throw LogDecodeError(
        fmt::format("{} trailing bytes after the last entry", data.size() - decoded.encodedSize));
  }
  return std::move(decoded.entries);
}

std::vector<LogEntry> DecodeLogBatches(std::span<const std::byte> data) {
  std::vector<LogEntry> entries;
  while (!data.empty()) {
    DecodedLog decoded = DecodeLog(data);
    std::ranges::move(decoded.entries, std::back_inserter(entries));
    data = data.subspan(decoded.encodedSize);
  }
  return entries;
}

}  // namespace logwire
