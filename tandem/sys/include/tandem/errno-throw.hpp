#pragma once

#include <cerrno>
#include <format>
#include <string_view>
#include <system_error>
#include <utility>

namespace tandem {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("epoll_ctl ADD failed for fd # {}", fd);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace tandem
