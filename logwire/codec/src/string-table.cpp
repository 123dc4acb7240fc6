#include "logwire/string-table.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace logwire {

uint32_t StringTable::intern(std::string_view str) {
  const auto it = _index.find(str);
  if (it != _index.end()) {
    return it->second;
  }
  const auto idx = static_cast<uint32_t>(_strings.size());
  _strings.emplace_back(str);
  _index.emplace(_strings.back(), idx);
  return idx;
}

int64_t StringTable::find(std::string_view str) const {
  const auto it = _index.find(str);
  return it == _index.end() ? -1 : static_cast<int64_t>(it->second);
}

void StringTable::clear() noexcept {
  _strings.clear();
  _index.clear();
}

}  // namespace logwire
