#pragma once

#include <cstdint>

#include "logwire/base-fd.hpp"
#include "logwire/timedef.hpp"

namespace logwire {

// Descriptors below are non-blocking and close-on-exec. They become readable when their kernel counter is
// non zero, and consume() reads and resets that counter.

// Wakes up a thread blocked on an EventLoop (eventfd).
class WakeupFd {
 public:
  WakeupFd();

  // Safe to call from any thread.
  void notify() const noexcept;

  // Number of notify() calls since the last consume(), 0 if none.
  std::uint64_t consume() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

// Monotonic periodic timer (timerfd), first expiring one period after construction.
class TickerFd {
 public:
  // Throws std::invalid_argument if 'period' is below one nanosecond.
  explicit TickerFd(SysDuration period);

  // Number of elapsed periods since the last consume(), 0 if none.
  std::uint64_t consume() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace logwire
