#include "tandem/http-codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "tandem/codec-error.hpp"
#include "tandem/framing-mode.hpp"
#include "tandem/header-line-parse.hpp"
#include "tandem/http-constants.hpp"
#include "tandem/http-header.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"
#include "tandem/message-head.hpp"
#include "tandem/raw-chars.hpp"
#include "tandem/string-equal-ignore-case.hpp"
#include "tandem/tchars.hpp"

namespace tandem {

namespace {

constexpr HeadParseResult ParseError(CodecError error) { return {ParseStatus::Error, error}; }

// Parses "method SP target SP HTTP-version".
CodecError ParseRequestLine(std::string_view line, MessageHead& head) {
  const auto firstSpace = line.find(' ');
  if (firstSpace == std::string_view::npos) {
    return CodecError::MalformedHead;
  }
  const std::string_view method = line.substr(0, firstSpace);
  line.remove_prefix(firstSpace + 1);
  const auto secondSpace = line.find(' ');
  if (secondSpace == std::string_view::npos) {
    return CodecError::MalformedHead;
  }
  const std::string_view target = line.substr(0, secondSpace);
  const std::string_view versionStr = line.substr(secondSpace + 1);

  http::Version version;
  if (!IsToken(method) || target.empty() ||
      !std::ranges::all_of(target, [](unsigned char ch) { return IsTargetChar(ch); }) ||
      !http::ParseVersion(versionStr, version)) {
    return CodecError::MalformedHead;
  }
  if (!version.isSupported()) {
    return CodecError::UnsupportedVersion;
  }
  head = MessageHead::Request(method, target, version);
  return CodecError::None;
}

// Parses "HTTP-version SP 3DIGIT [SP reason-phrase]".
CodecError ParseStatusLine(std::string_view line, MessageHead& head) {
  static constexpr std::size_t kStatusLen = 3;

  http::Version version;
  if (line.size() < http::kVersionStrLen + 1U + kStatusLen || line[http::kVersionStrLen] != ' ' ||
      !http::ParseVersion(line.substr(0, http::kVersionStrLen), version)) {
    return CodecError::MalformedHead;
  }
  line.remove_prefix(http::kVersionStrLen + 1U);
  const std::string_view statusStr = line.substr(0, kStatusLen);
  if (!std::ranges::all_of(statusStr, IsDigit) || statusStr[0] == '0') {
    return CodecError::MalformedHead;
  }
  line.remove_prefix(kStatusLen);
  std::string_view reason;
  if (!line.empty()) {
    if (line.front() != ' ') {
      return CodecError::MalformedHead;
    }
    reason = line.substr(1);
    if (!std::ranges::all_of(reason, [](unsigned char ch) { return IsFieldContentChar(ch); })) {
      return CodecError::MalformedHead;
    }
  }
  if (!version.isSupported()) {
    return CodecError::UnsupportedVersion;
  }
  const auto status = static_cast<http::StatusCode>(((statusStr[0] - '0') * 100) + ((statusStr[1] - '0') * 10) +
                                                    (statusStr[2] - '0'));
  head = MessageHead::Response(status, reason, version);
  return CodecError::None;
}

// Parses a Content-Length value. Accepts a list of identical values ("5, 5") as RFC 9110 section 8.6 allows.
bool ParseContentLength(std::string_view value, std::optional<uint64_t>& length) {
  bool valid = true;
  bool hasElement = false;
  ForEachListElement(value, [&](std::string_view element) {
    hasElement = true;
    uint64_t parsed{};
    const auto [ptr, ec] = std::from_chars(element.data(), element.data() + element.size(), parsed);
    if (ec != std::errc{} || ptr != element.data() + element.size() || !std::ranges::all_of(element, IsDigit) ||
        (length && *length != parsed)) {
      valid = false;
      return true;
    }
    length = parsed;
    return false;
  });
  return valid && hasElement;
}

void AppendDecimal(uint64_t value, RawChars& out) {
  char buf[20];
  out.append(std::string_view(buf, std::to_chars(buf, buf + sizeof(buf), value).ptr));
}

}  // namespace

HeadParseResult ParseHead(std::string_view input, MessageKind kind, HeadLimits limits, MessageHead& out) {
  std::size_t headStart = 0;
  if (kind == MessageKind::Request) {
    // RFC 9112 section 2.2: ignore at least one empty line received prior to the request-line.
    while (input.substr(headStart).starts_with(http::CRLF)) {
      headStart += http::CRLF.size();
      if (headStart > limits.maxHeaderBytes) {
        return ParseError(CodecError::HeadTooLarge);
      }
    }
  }

  // First pass: locate the end of the head, checking that every line is CRLF terminated.
  std::size_t headEnd = 0;
  std::size_t nbLines = 0;
  for (std::size_t lineStart = headStart;;) {
    const auto lf = input.find('\n', lineStart);
    if (lf == std::string_view::npos) {
      if (input.size() - headStart > limits.maxHeaderBytes) {
        return ParseError(CodecError::HeadTooLarge);
      }
      return {ParseStatus::NeedMoreData};
    }
    if (lf + 1U - headStart > limits.maxHeaderBytes) {
      return ParseError(CodecError::HeadTooLarge);
    }
    if (lf == lineStart || input[lf - 1U] != '\r' ||
        input.substr(lineStart, lf - 1U - lineStart).find('\r') != std::string_view::npos) {
      // bare LF or bare CR
      return ParseError(CodecError::MalformedHead);
    }
    if (lf - 1U == lineStart) {
      if (nbLines == 0) {
        // empty start line
        return ParseError(CodecError::MalformedHead);
      }
      headEnd = lf + 1U;
      break;
    }
    ++nbLines;
    // nbLines counts the start line
    if (nbLines > limits.maxHeaderCount + 1U) {
      return ParseError(CodecError::TooManyHeaders);
    }
    lineStart = lf + 1U;
  }

  // Second pass: parse the lines.
  const char* lineFirst = input.data() + headStart;
  const char* headLast = input.data() + headEnd - http::CRLF.size();
  const auto nextLine = [&lineFirst]() {
    const char* lineLast = lineFirst;
    while (*lineLast != '\r') {
      ++lineLast;
    }
    std::string_view line(lineFirst, lineLast);
    lineFirst = lineLast + http::CRLF.size();
    return line;
  };

  MessageHead head;
  const std::string_view startLine = nextLine();
  const CodecError startLineError =
      kind == MessageKind::Request ? ParseRequestLine(startLine, head) : ParseStatusLine(startLine, head);
  if (startLineError != CodecError::None) {
    return ParseError(startLineError);
  }

  while (lineFirst < headLast) {
    const std::string_view line = nextLine();
    const http::HeaderView header = http::ParseHeaderLine(line.data(), line.data() + line.size());
    if (!http::IsValidHeaderName(header.name) || !http::IsValidHeaderValue(header.value)) {
      return ParseError(CodecError::MalformedHead);
    }
    head.headers().append(header.name, header.value);
  }

  out = std::move(head);
  return {ParseStatus::Complete, CodecError::None, headEnd};
}

FramingResult ResolveFraming(const MessageHead& head, std::string_view requestMethod) {
  if (!head.isRequest() && (requestMethod == http::HEAD || http::IsBodylessStatus(head.status()))) {
    return {FramingMode::Length(0)};
  }

  const HeaderList& headers = head.headers();
  const bool hasTransferEncoding = headers.contains(http::TransferEncoding);
  const bool hasContentLength = headers.contains(http::ContentLength);
  if (hasTransferEncoding && hasContentLength) {
    return {FramingMode::Length(0), CodecError::ConflictingFramingHeaders};
  }

  if (hasTransferEncoding) {
    // Only a single 'chunked' coding is supported (no compression codings).
    std::size_t nbCodings = 0;
    bool chunked = false;
    for (std::string_view value : headers.values(http::TransferEncoding)) {
      ForEachListElement(value, [&](std::string_view coding) {
        ++nbCodings;
        chunked = CaseInsensitiveEqual(coding, http::chunked);
        return false;
      });
    }
    if (nbCodings != 1 || !chunked) {
      return {FramingMode::Length(0), CodecError::UnsupportedTransferCoding};
    }
    return {FramingMode::Chunked()};
  }

  if (hasContentLength) {
    std::optional<uint64_t> length;
    for (std::string_view value : headers.values(http::ContentLength)) {
      if (!ParseContentLength(value, length)) {
        return {FramingMode::Length(0), CodecError::InvalidContentLength};
      }
    }
    return {FramingMode::Length(*length)};
  }

  return {head.isRequest() ? FramingMode::Length(0) : FramingMode::CloseDelimited()};
}

void WriteHead(const MessageHead& head, std::optional<FramingMode> framing, RawChars& out) {
  char versionBuf[http::kVersionStrLen];
  const std::string_view version(versionBuf, http::WriteVersion(head.version(), versionBuf));

  if (head.isRequest()) {
    const RequestLine& requestLine = head.requestLine();
    out.append(requestLine.method);
    out.push_back(' ');
    out.append(requestLine.target);
    out.push_back(' ');
    out.append(version);
  } else {
    const StatusLine& statusLine = head.statusLine();
    out.append(version);
    out.push_back(' ');
    AppendDecimal(static_cast<uint64_t>(statusLine.status), out);
    out.push_back(' ');
    out.append(statusLine.reason.empty() ? http::ReasonPhraseFor(statusLine.status)
                                         : std::string_view(statusLine.reason));
  }
  out.append(http::CRLF);

  for (const http::Header& header : head.headers()) {
    if (CaseInsensitiveEqual(header.name(), http::ContentLength) ||
        CaseInsensitiveEqual(header.name(), http::TransferEncoding)) {
      continue;
    }
    out.append(header.raw());
    out.append(http::CRLF);
  }

  if (framing) {
    switch (framing->kind) {
      case FramingMode::Kind::Length:
        out.append(http::ContentLengthLower);
        out.append(http::HeaderSep);
        AppendDecimal(framing->length, out);
        out.append(http::CRLF);
        break;
      case FramingMode::Kind::Chunked:
        out.append(http::TransferEncodingLower);
        out.append(http::HeaderSep);
        out.append(http::chunked);
        out.append(http::CRLF);
        break;
      default:
        break;
    }
  }
  out.append(http::CRLF);
}

bool DeclaresKeepAlive(const MessageHead& head) noexcept {
  const HeaderList& headers = head.headers();
  if (headers.containsToken(http::Connection, http::close)) {
    return false;
  }
  return head.version().defaultsToKeepAlive() || headers.containsToken(http::Connection, http::keepalive);
}

bool ExpectsContinue(const MessageHead& head) noexcept {
  return head.isRequest() && head.version() >= http::HTTP_1_1 &&
         head.headers().containsToken(http::Expect, http::h100_continue);
}

}  // namespace tandem
