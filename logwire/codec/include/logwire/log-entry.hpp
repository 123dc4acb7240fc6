#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace logwire {

enum class ValueType : uint8_t { Boolean, Integer, String };

using LogValue = std::variant<bool, int32_t, std::string>;

// One observed signal change.
struct LogEntry {
  [[nodiscard]] ValueType valueType() const noexcept { return static_cast<ValueType>(value.index()); }

  bool operator==(const LogEntry&) const noexcept = default;

  int64_t timestamp{};  // milliseconds
  std::string deviceId;
  std::string signalName;
  LogValue value;
};

}  // namespace logwire
