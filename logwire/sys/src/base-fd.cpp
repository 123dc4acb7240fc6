#include "logwire/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "logwire/log.hpp"

namespace logwire {

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::reset(int newFd) noexcept {
  const int oldFd = std::exchange(_fd, newFd);
  if (oldFd == kClosedFd || oldFd == newFd) {
    return;
  }
  // On Linux the descriptor is released even when close reports EINTR, so it is never retried.
  if (::close(oldFd) != 0 && errno != EINTR) {
    const auto err = errno;
    log::error("Unable to close fd # {}: {}", oldFd, std::strerror(err));
    return;
  }
  log::trace("fd # {} closed", oldFd);
}

}  // namespace logwire
