#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace logwire {

// Ordered list of unique strings with a reverse index.
// Indexes are assigned in insertion order and never change until clear().
class StringTable {
 public:
  // Return the index of 'str', inserting it at the end if not present yet.
  uint32_t intern(std::string_view str);

  // Return the index of 'str', or -1 if absent.
  [[nodiscard]] int64_t find(std::string_view str) const;

  [[nodiscard]] std::string_view operator[](uint32_t idx) const { return _strings[idx]; }

  [[nodiscard]] std::span<const std::string> strings() const noexcept { return _strings; }

  [[nodiscard]] std::size_t size() const noexcept { return _strings.size(); }

  [[nodiscard]] bool empty() const noexcept { return _strings.empty(); }

  void clear() noexcept;

 private:
  struct TransparentHash {
    using is_transparent = void;

    std::size_t operator()(std::string_view sv) const noexcept { return std::hash<std::string_view>{}(sv); }
  };

  std::vector<std::string> _strings;
  std::unordered_map<std::string, uint32_t, TransparentHash, std::equal_to<>> _index;
};

}  // namespace logwire
