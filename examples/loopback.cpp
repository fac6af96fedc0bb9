#include <sys/socket.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tandem/base-fd.hpp"
#include "tandem/body-stream.hpp"
#include "tandem/body.hpp"
#include "tandem/connection.hpp"
#include "tandem/errno-throw.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/log.hpp"
#include "tandem/message-head.hpp"
#include "tandem/message.hpp"
#include "tandem/multiplexer.hpp"
#include "tandem/role.hpp"
#include "tandem/service-context.hpp"
#include "tandem/service.hpp"
#include "tandem/transport.hpp"

using namespace tandem;

namespace {

std::optional<Message> Greet(std::optional<Message> request) {
  std::string body("Hello from tandem! You requested ");
  body.append(request->head.target());
  body.append(" with ");
  body.append(std::to_string(request->body.bufferedView().size()));
  body.append(" body bytes\n");
  Message response{MessageHead::Response(http::StatusCodeOK), Body::Buffered(std::move(body))};
  response.head.header("Content-Type", "text/plain");
  return response;
}

// Sends 'nbRequests' requests, alternating a bodyless GET and a streamed POST, and logs every response.
class LoopbackClient {
 public:
  explicit LoopbackClient(uint32_t nbRequests) : _nbRequests(nbRequests) {}

  void call(ServiceContext& ctx, std::optional<Message> in) {
    _inbound = std::move(in);
    _body.clear();
    if (ctx.exchanges() + 1 == _nbRequests) {
      ctx.requestClose();
    }
  }

  ServiceStatus poll(ServiceContext& ctx, std::optional<Message>& out) {
    if (_inbound) {
      const BodyPoll res = CollectBody(_inbound->body, _body);
      if (res.status == BodyPollStatus::Pending) {
        return ServiceStatus::Pending;
      }
      log::info("Response #{}: {} {}", ctx.exchanges(), _inbound->head.status(), _body);
      _inbound.reset();
    }
    if (_nbSent == _nbRequests) {
      return ServiceStatus::Ready;
    }
    ++_nbSent;
    Message request{MessageHead::Request(_nbSent % 2 == 0 ? "POST" : "GET", "/loopback/" + std::to_string(_nbSent)),
                    Body{}};
    request.head.header("Host", "localhost");
    if (_nbSent % 2 == 0) {
      request.body = Body::Streaming(std::make_unique<StringChunksStream>(
          std::vector<std::string>{"streamed ", "request ", "body"}));
    }
    out = std::move(request);
    return ServiceStatus::Ready;
  }

 private:
  std::optional<Message> _inbound;
  std::string _body;
  uint32_t _nbRequests;
  uint32_t _nbSent{};
};

}  // namespace

int main(int argc, char **argv) {
  uint32_t nbRequests = 4;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), nbRequests);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1]) || nbRequests == 0) {
      std::cerr << "Invalid number of requests: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }
  if (argc > 2) {
    const auto level = log::level::from_str(argv[2]);
    if (level == log::level::off && std::string_view(argv[2]) != "off") {
      std::cerr << "Invalid log level: " << argv[2] << "\n";
      return EXIT_FAILURE;
    }
    log::set_level(level);
  }

  try {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0, fds) != 0) {
      throw_errno("socketpair");
    }

    Multiplexer multiplexer;
    multiplexer.emplace<Connection<AggregatingService<decltype(&Greet)>>>(
        fds[0], Role::Server, std::make_unique<PlainTransport>(BaseFd(fds[0])), AggregatingService(&Greet));
    multiplexer.emplace<Connection<LoopbackClient>>(fds[1], Role::Client,
                                                    std::make_unique<PlainTransport>(BaseFd(fds[1])),
                                                    LoopbackClient(nbRequests));
    multiplexer.run();  // until both sides are done
  } catch (const std::exception &e) {
    std::cerr << "Loopback encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
