#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <utility>

#include "tandem/codec-error.hpp"
#include "tandem/connection-config.hpp"
#include "tandem/connection-engine.hpp"
#include "tandem/message.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/role.hpp"
#include "tandem/service.hpp"
#include "tandem/transport.hpp"
#include "tandem/waker.hpp"

namespace tandem {

// A resumable HTTP/1.x connection, playing 'role' over the given transport with service S.
// It is driven by calling poll() whenever its stream or its service may have progressed. poll() never blocks.
//
// Server: HeadRead (request) -> ServiceRun -> HeadWrite (response) -> HeadRead ...
// Client: ServiceRun -> HeadWrite (request) -> HeadRead (response) -> ServiceRun ...
//
// The transport is closed (destroyed) as soon as the connection reaches its Terminal phase.
template <Service S>
class Connection {
 public:
  // Throws std::invalid_argument if the transport is null or the configuration is invalid.
  Connection(Role role, std::unique_ptr<ITransport> transport, S service, const ConnectionConfig& config = {})
      : _engine(role, std::move(transport), config), _service(std::move(service)) {}

  Connection(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection& operator=(Connection&&) = delete;

  ~Connection() = default;

  // Performs all the work that can be done without blocking, until the current phase completes, the connection
  // suspends, terminates, or exhausts its per-poll byte budget.
  PollResult poll() {
    _engine.beginPoll();
    try {
      if (_engine.phase() == Phase::ServiceRun) {
        return runService();
      }
      return _engine.pollIo();
    } catch (const std::exception& ex) {
      _serviceCalled = false;
      return _engine.failService(ex.what());
    }
  }

  [[nodiscard]] Role role() const noexcept { return _engine.role(); }

  [[nodiscard]] Phase phase() const noexcept { return _engine.phase(); }

  [[nodiscard]] bool isTerminal() const noexcept { return _engine.phase() == Phase::Terminal; }

  [[nodiscard]] TerminalReason terminalReason() const noexcept { return _engine.terminalReason(); }

  [[nodiscard]] ErrorSource errorSource() const noexcept { return _engine.errorSource(); }

  // Codec error that terminated the connection, if the codec failed.
  [[nodiscard]] CodecError lastError() const noexcept { return _engine.lastError(); }

  [[nodiscard]] const ConnectionStats& stats() const noexcept { return _engine.stats(); }

  // Handle that the service may reach through its ServiceContext to get the connection polled again.
  void setWaker(Waker waker) noexcept { _engine.setWaker(std::move(waker)); }

  [[nodiscard]] S& service() noexcept { return _service; }
  [[nodiscard]] const S& service() const noexcept { return _service; }

 private:
  PollResult runService() {
    if (!_serviceCalled) {
      _serviceCalled = true;
      _service.call(_engine.context(), _engine.takeInbound());
    }
    while (true) {
      std::optional<Message> outbound;
      if (_service.poll(_engine.context(), outbound) == ServiceStatus::Ready) {
        _serviceCalled = false;
        return _engine.completeService(std::move(outbound));
      }
      const PollResult res = _engine.pumpInbound();
      if (res.status != PollStatus::Progress || _engine.budgetExhausted()) {
        return res;
      }
    }
  }

  ConnectionEngine _engine;
  S _service;
  bool _serviceCalled{false};
};

}  // namespace tandem
