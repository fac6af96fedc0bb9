#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/http-headers.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"
#include "tandem/message-head.hpp"
#include "tandem/message.hpp"
#include "tandem/poll-result.hpp"
#include "tandem/service-context.hpp"
#include "tandem/service.hpp"
#include "tandem/waker.hpp"

namespace tandem::test {

inline Message MakeResponse(http::StatusCode status, std::string body = {}) {
  return Message{MessageHead::Response(status), Body::Buffered(std::move(body))};
}

inline Message MakeRequest(std::string_view method, std::string_view target, std::string body = {},
                           http::Version version = http::HTTP_1_1) {
  MessageHead head = MessageHead::Request(method, target, version);
  head.header("Host", "tandem.test");
  return Message{std::move(head), Body::Buffered(std::move(body))};
}

inline std::unique_ptr<BodyStream> MakeChunks(std::vector<std::string> chunks) {
  return std::make_unique<StringChunksStream>(std::move(chunks));
}

// Polls 'connection' until it suspends or terminates. Fails loudly instead of spinning forever.
template <class C>
PollResult Drive(C& connection, int maxPolls = 10000) {
  PollResult res = connection.poll();
  for (int pollPos = 1; res.status == PollStatus::PhaseComplete || res.status == PollStatus::Progress; ++pollPos) {
    if (pollPos == maxPolls) {
      throw std::runtime_error("connection keeps making progress");
    }
    res = connection.poll();
  }
  return res;
}

// Answers Pending a number of times before each result, the way a service waiting on some other task would.
template <class Fn>
class DeferredService {
 public:
  DeferredService(uint32_t nbPendingPolls, Fn fn) : _fn(std::move(fn)), _nbPendingPolls(nbPendingPolls) {}

  void call(ServiceContext& ctx, std::optional<Message> in) {
    _remainingPendingPolls = _nbPendingPolls;
    _result = internal::InvokeServiceFunction(_fn, ctx, std::move(in));
  }

  ServiceStatus poll([[maybe_unused]] ServiceContext& ctx, std::optional<Message>& out) {
    if (_remainingPendingPolls != 0) {
      --_remainingPendingPolls;
      return ServiceStatus::Pending;
    }
    out = std::move(_result);
    _result.reset();
    return ServiceStatus::Ready;
  }

 private:
  Fn _fn;
  std::optional<Message> _result;
  uint32_t _nbPendingPolls;
  uint32_t _remainingPendingPolls{};
};

// Gate shared between a test and a GatedService. Opening it wakes the connection waiting on it.
class Gate {
 public:
  // May be called from any thread.
  void open() {
    Waker waker;
    {
      std::scoped_lock<std::mutex> lock(_mutex);
      _open = true;
      waker = _waker;
    }
    waker.wake();
  }

  [[nodiscard]] bool isOpen() const {
    std::scoped_lock<std::mutex> lock(_mutex);
    return _open;
  }

  // Tells whether a service is waiting on this gate.
  [[nodiscard]] bool hasWaiter() const {
    std::scoped_lock<std::mutex> lock(_mutex);
    return static_cast<bool>(_waker);
  }

  void attach(const Waker& waker) {
    std::scoped_lock<std::mutex> lock(_mutex);
    _waker = waker;
  }

 private:
  mutable std::mutex _mutex;
  Waker _waker;
  bool _open{false};
};

// Answers Pending until its gate is opened, without any wake of its own in between.
template <class Fn>
class GatedService {
 public:
  GatedService(std::shared_ptr<Gate> gate, Fn fn) : _fn(std::move(fn)), _gate(std::move(gate)) {}

  void call(ServiceContext& ctx, std::optional<Message> in) {
    _gate->attach(ctx.waker());
    _result = internal::InvokeServiceFunction(_fn, ctx, std::move(in));
  }

  ServiceStatus poll([[maybe_unused]] ServiceContext& ctx, std::optional<Message>& out) {
    if (!_gate->isOpen()) {
      return ServiceStatus::Pending;
    }
    out = std::move(_result);
    _result.reset();
    return ServiceStatus::Ready;
  }

 private:
  Fn _fn;
  std::shared_ptr<Gate> _gate;
  std::optional<Message> _result;
};

struct ReceivedResponse {
  http::StatusCode status;
  HeaderList headers;
  std::string body;
};

// Client service writing the given requests in order and recording the responses, bodies read in full.
// Responses are kept in a shared vector so that they outlive the connection.
class ScriptedClient {
 public:
  explicit ScriptedClient(std::vector<Message> requests)
      : _requests(std::move(requests)), _responses(std::make_shared<std::vector<ReceivedResponse>>()) {}

  void call([[maybe_unused]] ServiceContext& ctx, std::optional<Message> in) {
    _inbound = std::move(in);
    _body.clear();
  }

  ServiceStatus poll([[maybe_unused]] ServiceContext& ctx, std::optional<Message>& out) {
    if (_inbound) {
      const BodyPoll res = CollectBody(_inbound->body, _body);
      if (res.status == BodyPollStatus::Pending) {
        return ServiceStatus::Pending;
      }
      _responses->push_back(ReceivedResponse{_inbound->head.status(), _inbound->head.headers(), std::move(_body)});
      _body.clear();
      _inbound.reset();
    }
    if (_nextRequestPos < _requests.size()) {
      out = std::move(_requests[_nextRequestPos++]);
    }
    return ServiceStatus::Ready;
  }

  [[nodiscard]] const std::vector<ReceivedResponse>& responses() const noexcept { return *_responses; }

  [[nodiscard]] std::shared_ptr<const std::vector<ReceivedResponse>> sharedResponses() const noexcept {
    return _responses;
  }

 private:
  std::vector<Message> _requests;
  std::size_t _nextRequestPos{};
  std::optional<Message> _inbound;
  std::string _body;
  std::shared_ptr<std::vector<ReceivedResponse>> _responses;
};

}  // namespace tandem::test
