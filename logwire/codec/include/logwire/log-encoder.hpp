#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "logwire/log-entry.hpp"
#include "logwire/string-table.hpp"

namespace logwire {

// Build the string table of an encoding unit: deviceId, signalName and string values, in encounter order.
void BuildStringTable(std::span<const LogEntry> entries, StringTable& table);

// Encode 'entries' into a self-contained buffer (header, string table, then one record per entry).
// An empty input gives an empty buffer.
// Entries are trusted: the only checked limits are the varint bound (std::length_error) and the 32-bit
// entry count. Timestamp deltas outside the int32 range are truncated.
// Deltas in [0, 0xFF00) use the 2-byte form. Deltas in [0xFF00, 0xFFFF] take the 5-byte form as well, although
// they fit in 16 bits: their first byte would read as the 0xFF wide marker.
[[nodiscard]] std::vector<std::byte> EncodeLogEntries(std::span<const LogEntry> entries);

// Same as above, with 'table' already built by BuildStringTable from exactly 'entries'.
[[nodiscard]] std::vector<std::byte> EncodeLogEntries(std::span<const LogEntry> entries, const StringTable& table);

}  // namespace logwire
