#include "logwire/streaming-log-encoder.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include "logwire/log-encoder.hpp"
#include "logwire/log-entry.hpp"
#include "logwire/log.hpp"

namespace logwire {

StreamingLogEncoder::StreamingLogEncoder(std::size_t batchSize) : _batchSize(batchSize) {
  if (batchSize == 0) {
    throw std::invalid_argument("StreamingLogEncoder batch size must be > 0");
  }
  _entries.reserve(batchSize);
}

std::optional<std::vector<std::byte>> StreamingLogEncoder::addEntry(LogEntry entry) {
  BuildStringTable(std::span<const LogEntry>(&entry, 1), _table);
  _entries.push_back(std::move(entry));
  if (_entries.size() < _batchSize) {
    return std::nullopt;
  }
  return flush();
}

std::vector<std::byte> StreamingLogEncoder::flush() {
  std::vector<std::byte> encoded = EncodeLogEntries(_entries, _table);
  log::debug("Encoded batch of {} entries with {} unique strings into {} bytes", _entries.size(),
             _table.size(), encoded.size());
  _entries.clear();
  _table.clear();
  return encoded;
}

}  // namespace logwire
