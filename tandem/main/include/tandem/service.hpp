#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/message.hpp"
#include "tandem/service-context.hpp"

namespace tandem {

enum class ServiceStatus : uint8_t { Ready, Pending };

// Application logic plugged into a connection.
// call() starts one invocation with the peer's message (std::nullopt for the very first invocation of a client),
// then poll() is called until it returns Ready, setting 'out' to the message to write, or leaving it empty to end
// the connection. poll() must not block: it returns Pending when it waits for something, for instance for bytes of
// the inbound body, which the connection reads meanwhile.
template <class S>
concept Service = requires(S service, ServiceContext& ctx, std::optional<Message> in, std::optional<Message>& out) {
  { service.call(ctx, std::move(in)) } -> std::same_as<void>;
  { service.poll(ctx, out) } -> std::same_as<ServiceStatus>;
};

namespace internal {

template <class Fn>
std::optional<Message> InvokeServiceFunction(Fn& fn, ServiceContext& ctx, std::optional<Message> in) {
  if constexpr (std::is_invocable_v<Fn&, ServiceContext&, std::optional<Message>>) {
    return fn(ctx, std::move(in));
  } else {
    return fn(std::move(in));
  }
}

}  // namespace internal

// Adapts a synchronous callable to the Service concept.
// The callable has signature std::optional<Message>(std::optional<Message>), optionally taking the ServiceContext&
// as first argument. It receives the inbound body as a live stream: use AggregatingService to get it buffered.
template <class Fn>
class FunctionService {
 public:
  explicit FunctionService(Fn fn) noexcept(std::is_nothrow_move_constructible_v<Fn>) : _fn(std::move(fn)) {}

  void call(ServiceContext& ctx, std::optional<Message> in) {
    _result = internal::InvokeServiceFunction(_fn, ctx, std::move(in));
  }

  ServiceStatus poll([[maybe_unused]] ServiceContext& ctx, std::optional<Message>& out) {
    out = std::move(_result);
    _result.reset();
    return ServiceStatus::Ready;
  }

 private:
  Fn _fn;
  std::optional<Message> _result;
};

// Same as FunctionService, except that the inbound body is read completely before the callable is invoked.
// The callable then always receives a Buffered body.
template <class Fn>
class AggregatingService {
 public:
  explicit AggregatingService(Fn fn) noexcept(std::is_nothrow_move_constructible_v<Fn>) : _fn(std::move(fn)) {}

  void call([[maybe_unused]] ServiceContext& ctx, std::optional<Message> in) {
    _inbound = std::move(in);
    _collected.clear();
  }

  ServiceStatus poll(ServiceContext& ctx, std::optional<Message>& out) {
    if (!_inbound) {
      out = internal::InvokeServiceFunction(_fn, ctx, std::nullopt);
      return ServiceStatus::Ready;
    }
    switch (CollectBody(_inbound->body, _collected).status) {
      case BodyPollStatus::Pending:
        return ServiceStatus::Pending;
      case BodyPollStatus::End: {
        Message message{std::move(_inbound->head), Body::Buffered(std::exchange(_collected, {}))};
        _inbound.reset();
        out = internal::InvokeServiceFunction(_fn, ctx, std::move(message));
        return ServiceStatus::Ready;
      }
      default:
        // The connection detected the body failure and answers for us.
        _inbound.reset();
        out.reset();
        return ServiceStatus::Ready;
    }
  }

 private:
  Fn _fn;
  std::optional<Message> _inbound;
  std::string _collected;
};

}  // namespace tandem
