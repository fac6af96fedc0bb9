#include "tandem/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include "tandem/errno-throw.hpp"
#include "tandem/event.hpp"
#include "tandem/log.hpp"
#include "tandem/timedef.hpp"

namespace tandem {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

int ToMilliseconds(SysDuration duration) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(duration).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _pollTimeoutMs(ToMilliseconds(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _epollEvents(std::max(1U, initialCapacity)) {
  if (!_baseFd) {
    throw_errno("epoll_create1 failed");
  }
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    throw_errno("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{event.eventBmp, epoll_data_t{.fd = event.fd}};
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    errno = err;
    return false;
  }
  return true;
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
    // Benign if the fd was already closed, as closing removes it from the interest list.
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  const int nbReadyFds =
      ::epoll_wait(_baseFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()), _pollTimeoutMs);
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    }
    return {};
  }

  const auto nbReady = static_cast<std::size_t>(nbReadyFds);
  _readyEvents.clear();
  for (std::size_t idx = 0; idx < nbReady; ++idx) {
    _readyEvents.push_back(EventFd{static_cast<EventBmp>(_epollEvents[idx].events), _epollEvents[idx].data.fd});
  }

  // If saturated, grow buffer for subsequent polls.
  if (nbReady == _epollEvents.size()) {
    _epollEvents.resize(_epollEvents.size() * 2U);
  }
  return _readyEvents;
}

void EventLoop::updatePollTimeout(SysDuration pollTimeout) { _pollTimeoutMs = ToMilliseconds(pollTimeout); }

}  // namespace tandem
