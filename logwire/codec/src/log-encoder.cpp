#include "logwire/log-encoder.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "logwire/big-endian.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log-entry.hpp"
#include "logwire/log-format.hpp"
#include "logwire/string-table.hpp"
#include "logwire/varint.hpp"

namespace logwire {

namespace {

using logformat::ValueTag;

uint32_t CheckedU32(std::size_t value, std::string_view what) {
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error(fmt::format("{} {} does not fit in 32 bits", what, value));
  }
  return static_cast<uint32_t>(value);
}

void AppendTag(ValueTag tag, std::vector<std::byte>& out) { out.push_back(static_cast<std::byte>(tag)); }

void AppendDelta(int64_t delta, std::vector<std::byte>& out) {
  if (delta >= 0 && delta < logformat::kShortDeltaLimit) {
    AppendBigEndian(static_cast<uint16_t>(delta), out);
  } else {
    out.push_back(logformat::kWideDeltaMarker);
    AppendBigEndian(static_cast<uint32_t>(static_cast<int32_t>(delta)), out);
  }
}

void AppendString(std::string_view str, std::vector<std::byte>& out) {
  AppendVarint(CheckedU32(str.size(), "String length"), out);
  const auto* first = reinterpret_cast<const std::byte*>(str.data());
  out.insert(out.end(), first, first + str.size());
}

void AppendInteger(int32_t value, std::vector<std::byte>& out) {
  if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max()) {
    AppendTag(ValueTag::Int8, out);
    AppendBigEndian(static_cast<uint8_t>(value), out);
  } else if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max()) {
    AppendTag(ValueTag::Int16, out);
    AppendBigEndian(static_cast<uint16_t>(value), out);
  } else {
    AppendTag(ValueTag::Int32, out);
    AppendBigEndian(static_cast<uint32_t>(value), out);
  }
}

void AppendEntry(const LogEntry& entry, int64_t delta, const StringTable& table, std::vector<std::byte>& out) {
  AppendDelta(delta, out);
  AppendVarint(static_cast<uint32_t>(table.find(entry.deviceId)), out);
  AppendVarint(static_cast<uint32_t>(table.find(entry.signalName)), out);

  std::visit(
      [&](const auto& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, bool>) {
          AppendTag(val ? ValueTag::BoolTrue : ValueTag::BoolFalse, out);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          AppendInteger(val, out);
        } else {
          const auto strIdx = table.find(val);
          if (strIdx >= 0) {
            AppendTag(ValueTag::StringIndex, out);
            AppendVarint(static_cast<uint32_t>(strIdx), out);
          } else {
            AppendTag(ValueTag::StringRaw, out);
            AppendString(val, out);
          }
        }
      },
      entry.value);
}

}  // namespace

void BuildStringTable(std::span<const LogEntry> entries, StringTable& table) {
  for (const LogEntry& entry : entries) {
    table.intern(entry.deviceId);
    table.intern(entry.signalName);
    if (const auto* str = std::get_if<std::string>(&entry.value)) {
      table.intern(*str);
    }
  }
}

std::vector<std::byte> EncodeLogEntries(std::span<const LogEntry> entries) {
  StringTable table;
  BuildStringTable(entries, table);
  return EncodeLogEntries(entries, table);
}

std::vector<std::byte> EncodeLogEntries(std::span<const LogEntry> entries, const StringTable& table) {
  std::vector<std::byte> out;
  if (entries.empty()) {
    return out;
  }

  const uint32_t entryCount = CheckedU32(entries.size(), "Entry count");

  // Rough guess: small entries are around 8 bytes each.
  out.reserve(logformat::kHeaderSize + (table.size() * 16U) + (entries.size() * 8U));
  out.resize(logformat::kHeaderSize);

  AppendVarint(CheckedU32(table.size(), "String table size"), out);
  for (const std::string& str : table.strings()) {
    AppendString(str, out);
  }
  const uint32_t dataOffset = CheckedU32(out.size(), "Data offset");

  const int64_t firstTimestamp = entries.front().timestamp;
  int64_t prevTimestamp = firstTimestamp;
  for (const LogEntry& entry : entries) {
    // Wrapping subtraction: extreme timestamps must not overflow int64.
    const auto delta =
        static_cast<int64_t>(static_cast<uint64_t>(entry.timestamp) - static_cast<uint64_t>(prevTimestamp));
    AppendEntry(entry, delta, table, out);
    prevTimestamp = entry.timestamp;
  }

  std::byte* header = out.data();
  std::ranges::copy(logformat::kMagic, header);
  header[4] = static_cast<std::byte>(logformat::kVersion);
  header[5] = static_cast<std::byte>(logformat::kFlags);
  WriteBigEndian(entryCount, header + 6);
  WriteBigEndian(static_cast<uint32_t>(logformat::kHeaderSize), header + 10);
  WriteBigEndian(dataOffset, header + 14);
  WriteBigEndian(static_cast<uint64_t>(firstTimestamp), header + 18);
  return out;
}

}  // namespace logwire
