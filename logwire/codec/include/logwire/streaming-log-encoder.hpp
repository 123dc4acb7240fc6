#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "logwire/log-entry.hpp"
#include "logwire/string-table.hpp"

namespace logwire {

// Buffers log entries and encodes them in batches of bounded size.
// Each produced buffer is self-contained (own header and string table): dictionary state is not carried
// from one batch to the next, trading some redundancy for flat memory usage.
class StreamingLogEncoder {
 public:
  static constexpr std::size_t kDefaultBatchSize = 10000;

  struct Stats {
    std::size_t uniqueStrings;
    std::size_t bufferedEntries;
  };

  // Throws std::invalid_argument if batchSize is 0.
  explicit StreamingLogEncoder(std::size_t batchSize = kDefaultBatchSize);

  // Buffer 'entry'. When the batch is full, encode it, reset the buffer and return the encoded batch.
  std::optional<std::vector<std::byte>> addEntry(LogEntry entry);

  // Encode whatever is pending (possibly nothing, giving an empty buffer) and reset.
  std::vector<std::byte> flush();

  // Statistics of the pending batch.
  [[nodiscard]] Stats stats() const noexcept { return {_table.size(), _entries.size()}; }

  [[nodiscard]] std::size_t batchSize() const noexcept { return _batchSize; }

 private:
  std::vector<LogEntry> _entries;
  // String table of the pending batch, grown as entries arrive and handed as is to the encoder.
  StringTable _table;
  std::size_t _batchSize;
};

}  // namespace logwire
