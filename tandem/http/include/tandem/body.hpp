#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "tandem/body-stream.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/payload.hpp"

namespace tandem {

// A stream known in advance to yield exactly 'length' bytes. Written with content-length.
struct ExactSizeBody {
  uint64_t length{};
  std::unique_ptr<BodyStream> stream;
};

// The whole payload, already resident in memory. Written with content-length.
struct BufferedBody {
  Payload bytes;
};

// A stream of unknown total length. Written with transfer-encoding: chunked.
struct StreamingBody {
  std::unique_ptr<BodyStream> stream;
};

// Payload of a message, one of three transfer strategies. Move-only.
// Consumers are expected to handle the three alternatives exhaustively, through visit().
class Body {
 public:
  using Variant = std::variant<BufferedBody, ExactSizeBody, StreamingBody>;

  // Empty buffered body.
  Body() noexcept = default;

  Body(BufferedBody body) noexcept : _repr(std::move(body)) {}

  // Throws std::invalid_argument if the stream is null.
  Body(ExactSizeBody body);

  // Throws std::invalid_argument if the stream is null.
  Body(StreamingBody body);

  static Body Buffered(std::string bytes) { return BufferedBody{Payload(std::move(bytes))}; }

  static Body ExactSize(uint64_t length, std::unique_ptr<BodyStream> stream) {
    return ExactSizeBody{length, std::move(stream)};
  }

  static Body Streaming(std::unique_ptr<BodyStream> stream) { return StreamingBody{std::move(stream)}; }

  [[nodiscard]] bool isBuffered() const noexcept { return std::holds_alternative<BufferedBody>(_repr); }
  [[nodiscard]] bool isExactSize() const noexcept { return std::holds_alternative<ExactSizeBody>(_repr); }
  [[nodiscard]] bool isStreaming() const noexcept { return std::holds_alternative<StreamingBody>(_repr); }

  // Framing this body is written with: content-length for ExactSize and Buffered, chunked for Streaming.
  [[nodiscard]] FramingMode framing() const noexcept;

  // Resident bytes of a Buffered body, empty view for the other alternatives.
  [[nodiscard]] std::string_view bufferedView() const noexcept;

  template <class Visitor>
  decltype(auto) visit(Visitor&& visitor) {
    return std::visit(std::forward<Visitor>(visitor), _repr);
  }

  template <class Visitor>
  decltype(auto) visit(Visitor&& visitor) const {
    return std::visit(std::forward<Visitor>(visitor), _repr);
  }

 private:
  Variant _repr;
};

// Appends to 'out' all body bytes available without waiting, consuming them.
// Returns End once the whole body has been read, Pending if more bytes are expected later, or the Error.
BodyPoll CollectBody(Body& body, std::string& out);

}  // namespace tandem
