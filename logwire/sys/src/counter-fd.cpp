#include "logwire/counter-fd.hpp"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <stdexcept>
#include <string_view>

#include "logwire/errno-throw.hpp"
#include "logwire/fmt.hpp"
#include "logwire/log.hpp"
#include "logwire/timedef.hpp"

namespace logwire {

namespace {

constexpr std::int64_t kNanosPerSecond = 1000000000;

std::uint64_t ReadCounter(int fd, std::string_view kind) noexcept {
  std::uint64_t counter = 0;
  if (::read(fd, &counter, sizeof(counter)) == -1) {
    const auto err = errno;
    if (err != EAGAIN) {
      log::error("Unable to read {} fd # {}: {}", kind, fd, std::strerror(err));
    }
    return 0;
  }
  return counter;
}

}  // namespace

WakeupFd::WakeupFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a wakeup eventfd");
  }
  log::debug("Wakeup fd # {} opened", fd());
}

void WakeupFd::notify() const noexcept {
  static constexpr std::uint64_t kOne = 1;
  // EAGAIN means the counter is saturated, the fd is readable anyway.
  if (::write(fd(), &kOne, sizeof(kOne)) == -1 && errno != EAGAIN) {
    const auto err = errno;
    log::error("Unable to notify wakeup fd # {}: {}", fd(), std::strerror(err));
  }
}

std::uint64_t WakeupFd::consume() const noexcept { return ReadCounter(fd(), "wakeup"); }

TickerFd::TickerFd(SysDuration period) : _baseFd(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a ticker timerfd");
  }
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(period).count();
  if (nanos <= 0) {
    throw std::invalid_argument(fmt::format("Ticker period must be positive, got {} ns", nanos));
  }

  itimerspec spec{};
  spec.it_interval.tv_sec = static_cast<time_t>(nanos / kNanosPerSecond);
  spec.it_interval.tv_nsec = static_cast<long>(nanos % kNanosPerSecond);
  spec.it_value = spec.it_interval;
  if (::timerfd_settime(fd(), 0, &spec, nullptr) != 0) {
    const int tickerFd = fd();
    throw_errno("Unable to arm ticker fd # {}", tickerFd);
  }
  log::debug("Ticker fd # {} armed every {} ns", fd(), nanos);
}

std::uint64_t TickerFd::consume() const noexcept { return ReadCounter(fd(), "ticker"); }

}  // namespace logwire
