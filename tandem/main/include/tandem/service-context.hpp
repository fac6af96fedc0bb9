#pragma once

#include <cstdint>

#include "tandem/role.hpp"
#include "tandem/waker.hpp"

namespace tandem {

class ConnectionEngine;

// View of its connection given to a service at each invocation.
class ServiceContext {
 public:
  explicit ServiceContext(Role role) noexcept : _role(role) {}

  [[nodiscard]] Role role() const noexcept { return _role; }

  // Number of completed exchanges on this connection.
  [[nodiscard]] uint64_t exchanges() const noexcept { return _exchanges; }

  // Whether the connection is currently expected to outlive the current exchange.
  [[nodiscard]] bool isPersistent() const noexcept { return _persistent && !_closeRequested; }

  // Asks the connection to close once the current exchange is complete.
  void requestClose() noexcept { _closeRequested = true; }

  [[nodiscard]] bool closeRequested() const noexcept { return _closeRequested; }

  // A service returning Pending for another reason than waiting for inbound body bytes is not polled again until this
  // waker is called, when the connection is driven by a Multiplexer.
  [[nodiscard]] const Waker& waker() const noexcept { return _waker; }

 private:
  friend class ConnectionEngine;

  Role _role;
  Waker _waker;
  uint64_t _exchanges{};
  bool _persistent{true};
  bool _closeRequested{false};
};

}  // namespace tandem
