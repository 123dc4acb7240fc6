#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "logwire/log-entry.hpp"

namespace logwire {

// Raised when decoding a malformed or truncated log buffer.
class LogDecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct LogHeader {
  uint8_t version{};
  uint8_t flags{};
  uint32_t entryCount{};
  uint32_t tableOffset{};
  uint32_t dataOffset{};
  int64_t firstTimestamp{};
};

struct DecodedLog {
  LogHeader header;
  std::vector<std::string> strings;
  std::vector<LogEntry> entries;
  std::size_t encodedSize{};  // number of bytes consumed from the input
};

// Decode the encoded unit at the start of 'data'. Bytes after the last entry are left untouched and
// reported through DecodedLog::encodedSize. Throws LogDecodeError on malformed input.
[[nodiscard]] DecodedLog DecodeLog(std::span<const std::byte> data);

// Decode a buffer holding exactly one encoded unit (or nothing: an empty buffer gives no entries).
// Throws LogDecodeError on malformed input or trailing bytes.
[[nodiscard]] std::vector<LogEntry> DecodeLogEntries(std::span<const std::byte> data);

// Decode a sequence of concatenated encoded units, as produced by successive StreamingLogEncoder batches.
// Throws LogDecodeError on malformed input.
[[nodiscard]] std::vector<LogEntry> DecodeLogBatches(std::span<const std::byte> data);

}  // namespace logwire
