#include "logwire/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>
#include <utility>

#include "logwire/errno-throw.hpp"
#include "logwire/event.hpp"
#include "logwire/log.hpp"
#include "logwire/timedef.hpp"

namespace logwire {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

int ToTimeoutMs(SysDuration timeout) {
  if (timeout < SysDuration::zero()) {
    return -1;
  }
  // Round up so that a sub-millisecond timeout does not degenerate into a busy loop.
  return static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(timeout).count());
}

epoll_event* EpollEvents(std::vector<char>& raw) { return reinterpret_cast<epoll_event*>(raw.data()); }

}  // namespace

EventLoop::EventLoop(uint32_t initialCapacity)
    : _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _events(std::max(1U, initialCapacity)),
      _rawEvents(_events.size() * sizeof(epoll_event)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    // Usually benign if fd already closed.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll(SysDuration timeout) {
  const auto capacityBeforePoll = _events.size();
  epoll_event* epollEvents = EpollEvents(_rawEvents);

  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), ToTimeoutMs(timeout));
  if (nbReadyFds == -1) {
    if (errno == EINTR) {
      return {};
    }
    throw_errno("epoll_wait failed (fd # {})", _baseFd.fd());
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _events[static_cast<std::size_t>(idx)] =
        EventFd{static_cast<EventBmp>(epollEvents[idx].events), epollEvents[idx].data.fd};
  }
  std::span<const EventFd> ready(_events.data(), static_cast<std::size_t>(nbReadyFds));

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    // Growing invalidates 'ready', copy it first.
    std::vector<EventFd> grown(capacityBeforePoll * 2U);
    std::ranges::copy(ready, grown.begin());
    _events = std::move(grown);
    _rawEvents.resize(_events.size() * sizeof(epoll_event));
    ready = std::span<const EventFd>(_events.data(), static_cast<std::size_t>(nbReadyFds));
  }
  return ready;
}

}  // namespace logwire
