#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <sys/epoll.h>

#include "tandem/base-fd.hpp"
#include "tandem/event.hpp"
#include "tandem/timedef.hpp"

namespace tandem {

// Thin RAII wrapper over an epoll instance, used in level-triggered mode.
// The ready-events buffer doubles each time a poll fills it completely and never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  // Register fd with given events.
  // On error, throws std::system_error.
  void addOrThrow(EventFd event) const;

  // Register fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events.
  // Returns true on success, false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Delete fd from monitoring. Failures are logged only.
  void del(int fd) const;

  // Polls for ready events up to the poll timeout.
  // Returns a span over an internal buffer, valid until next poll.
  // An empty span means timeout, EINTR or a failure of epoll_wait (logged).
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return static_cast<uint32_t>(_epollEvents.size()); }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  int _pollTimeoutMs;
  BaseFd _baseFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<EventFd> _readyEvents;
};

}  // namespace tandem
