#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "logwire/base-fd.hpp"
#include "logwire/event.hpp"
#include "logwire/timedef.hpp"

namespace logwire {

// Thin RAII wrapper over epoll.
// The event buffer grows by doubling whenever a poll returns exactly capacity() events. It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 8;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  explicit EventLoop(uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Modify fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Logs on error.
  void del(int fd) const;

  // Polls for ready events for at most 'timeout' (negative blocks indefinitely).
  // Returns an empty span on timeout or EINTR. Throws std::system_error on unrecoverable failure.
  [[nodiscard]] std::span<const EventFd> poll(SysDuration timeout);

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_events.size()); }

 private:
  BaseFd _baseFd;
  std::vector<EventFd> _events;
  std::vector<char> _rawEvents;
};

}  // namespace logwire
