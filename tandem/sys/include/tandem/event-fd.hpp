#pragma once

#include "tandem/base-fd.hpp"

namespace tandem {

// RAII eventfd (non-blocking, close-on-exec), used to interrupt an EventLoop poll from any thread.
class EventFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  EventFd();

  // Makes fd() readable until the next read().
  void send() const noexcept;

  // Drains pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tandem
