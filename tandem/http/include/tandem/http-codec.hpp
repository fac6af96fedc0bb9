#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "tandem/body.hpp"
#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/message-head.hpp"
#include "tandem/raw-chars.hpp"

namespace tandem {

enum class ParseStatus : uint8_t { Complete, NeedMoreData, Error };

struct HeadLimits {
  // Cap on the bytes of the head, start line and final CRLF included.
  std::size_t maxHeaderBytes{8192};
  std::size_t maxHeaderCount{64};
};

struct HeadParseResult {
  ParseStatus status;
  CodecError error{CodecError::None};
  // Number of bytes of 'input' that make up the head (leading empty lines included). Only set when Complete.
  std::size_t consumed{};
};

// Parses a message head of the given kind from the beginning of 'input'.
// Stateless: on NeedMoreData, call again with the same bytes plus the newly received ones.
// On Complete, 'out' receives the head; it is left untouched otherwise.
HeadParseResult ParseHead(std::string_view input, MessageKind kind, HeadLimits limits, MessageHead& out);

struct FramingResult {
  FramingMode mode;
  CodecError error{CodecError::None};
};

// Resolves how the body following 'head' is framed.
// For a response, 'requestMethod' is the method of the request it answers: responses to HEAD, as well as 1xx, 204
// and 304 responses, have no body whatever their headers say. A request without framing headers has no body,
// a response without framing headers is close-delimited.
FramingResult ResolveFraming(const MessageHead& head, std::string_view requestMethod = {});

// Serializes 'head' into 'out': start line, caller headers, the framing header, then the blank line.
// Caller supplied content-length / transfer-encoding headers are not written, the framing header is derived from
// 'framing' instead: content-length for Length, transfer-encoding: chunked for Chunked, nothing for CloseDelimited or
// std::nullopt.
void WriteHead(const MessageHead& head, std::optional<FramingMode> framing, RawChars& out);

// Serializes 'head' with the framing header derived from the body alternative.
inline void WriteHead(const MessageHead& head, const Body& body, RawChars& out) {
  WriteHead(head, body.framing(), out);
}

// Tells whether the sender of 'head' asks for a persistent connection: HTTP/1.1 unless Connection lists 'close',
// HTTP/1.0 only if Connection lists 'keep-alive'. 'close' wins over 'keep-alive'.
bool DeclaresKeepAlive(const MessageHead& head) noexcept;

// Tells whether 'head' is an HTTP/1.1 request with 'Expect: 100-continue'.
bool ExpectsContinue(const MessageHead& head) noexcept;

}  // namespace tandem
