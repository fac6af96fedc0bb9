#include "tandem/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "tandem/errno-throw.hpp"
#include "tandem/log.hpp"

namespace tandem {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (fd() == BaseFd::kClosedFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    const int savedErr = errno;
    // EAGAIN: the counter is saturated, the fd is readable anyway
    if (savedErr != EAGAIN) {
      log::error("EventFd fd # {} send failed: {}", fd(), std::strerror(savedErr));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const int savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd fd # {} read failed: {}", fd(), std::strerror(savedErr));
    }
  } else {
    log::trace("EventFd fd # {} drained (value={})", fd(), static_cast<unsigned long long>(counterValue));
  }
}

}  // namespace tandem
