#include "tandem/body.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "tandem/body-stream.hpp"
#include "tandem/framing-mode.hpp"

namespace tandem {

namespace {

BodyPoll CollectStream(BodyStream& stream, std::string& out) {
  while (true) {
    const BodyPoll chunk = stream.pollChunk();
    if (chunk.status != BodyPollStatus::Data) {
      return chunk;
    }
    out.append(chunk.data);
  }
}

}  // namespace

Body::Body(ExactSizeBody body) : _repr(std::move(body)) {
  if (!std::get<ExactSizeBody>(_repr).stream) {
    throw std::invalid_argument("ExactSize body requires a stream");
  }
}

Body::Body(StreamingBody body) : _repr(std::move(body)) {
  if (!std::get<StreamingBody>(_repr).stream) {
    throw std::invalid_argument("Streaming body requires a stream");
  }
}

FramingMode Body::framing() const noexcept {
  return visit([](const auto& body) -> FramingMode {
    using T = std::decay_t<decltype(body)>;
    if constexpr (std::is_same_v<T, BufferedBody>) {
      return FramingMode::Length(body.bytes.size());
    } else if constexpr (std::is_same_v<T, ExactSizeBody>) {
      return FramingMode::Length(body.length);
    } else {
      static_assert(std::is_same_v<T, StreamingBody>);
      return FramingMode::Chunked();
    }
  });
}

std::string_view Body::bufferedView() const noexcept {
  const auto* buffered = std::get_if<BufferedBody>(&_repr);
  return buffered == nullptr ? std::string_view{} : buffered->bytes.view();
}

BodyPoll CollectBody(Body& body, std::string& out) {
  return body.visit([&out](auto& alternative) -> BodyPoll {
    using T = std::decay_t<decltype(alternative)>;
    if constexpr (std::is_same_v<T, BufferedBody>) {
      out.append(alternative.bytes.view());
      alternative.bytes.clear();
      return BodyPoll::End();
    } else {
      return CollectStream(*alternative.stream, out);
    }
  });
}

}  // namespace tandem
