#include "tandem/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "tandem/log.hpp"

namespace tandem {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // On Linux the fd is released even when close fails with EINTR, so it must not be retried.
  if (::close(_fd) != 0) {
    const int err = errno;
    if (err != EINTR) {
      log::error("close fd # {} failed: {}", _fd, std::strerror(err));
    }
  } else {
    log::debug("fd # {} closed", _fd);
  }
  _fd = kClosedFd;
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace tandem
