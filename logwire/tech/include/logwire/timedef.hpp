#pragma once

#include <chrono>
#include <cstdint>

namespace logwire {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// Deadlines and intervals use steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

/// Milliseconds since Unix epoch, the timestamp unit of protocol messages.
[[nodiscard]] inline int64_t UnixMillisNow() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SysClock::now().time_since_epoch()).count();
}

}  // namespace logwire
