#pragma once

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

#include "logwire/fmt.hpp"

namespace logwire {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("connect failed for {}", host);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmtStr, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::format(fmtStr, std::forward<Args>(args)...));
}

}  // namespace logwire
