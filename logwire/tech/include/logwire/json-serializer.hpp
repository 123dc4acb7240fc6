#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <stdexcept>
#include <string>
#include <string_view>

namespace logwire {

/// Serialize a C++ object to JSON string using glaze.
/// Template parameter T must be a type that glaze can serialize.
template <typename T>
[[nodiscard]] inline std::string SerializeToJson(const T& obj) {
  return glz::write_json(obj).value_or(std::string{});
}

/// Parse a JSON document into 'obj'. Unknown keys are ignored.
/// Throws std::invalid_argument with glaze's error description on malformed input.
template <typename T>
inline void ParseJson(std::string_view json, T& obj) {
  std::string buffer(json);
  const auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(obj, buffer);
  if (ec) {
    throw std::invalid_argument(glz::format_error(ec, buffer));
  }
}

template <typename T>
[[nodiscard]] inline T ParseJson(std::string_view json) {
  T obj{};
  ParseJson(json, obj);
  return obj;
}

}  // namespace logwire
