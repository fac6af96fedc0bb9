#include "tandem/http-error-build.hpp"

#include <charconv>
#include <cstddef>
#include <string_view>

#include "tandem/http-constants.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/raw-chars.hpp"
#include "tandem/timedef.hpp"
#include "tandem/timestring.hpp"

namespace tandem {

namespace {

void AppendHeader(RawChars& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

}  // namespace

RawChars BuildSimpleError(http::StatusCode status, std::string_view body, bool addDate) {
  const std::string_view reason = http::ReasonPhraseFor(status);
  if (body.empty()) {
    body = reason;
  }

  static constexpr std::size_t kStatusLen = 3U;
  static constexpr std::size_t kHeadSizeEstimate = 160U;

  RawChars out(kHeadSizeEstimate + reason.size() + body.size());

  // Status line: HTTP/1.1 400 Bad Request\r\n
  char statusBuf[kStatusLen + 1U];
  const std::string_view statusStr(statusBuf, std::to_chars(statusBuf, statusBuf + sizeof(statusBuf), status).ptr);
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  out.append(statusStr);
  out.push_back(' ');
  out.append(reason);
  out.append(http::CRLF);

  if (addDate) {
    char dateBuf[kRFC7231DateStrLen];
    TimeToStringRFC7231(SysClock::now(), dateBuf);
    AppendHeader(out, http::DateLower, std::string_view(dateBuf, kRFC7231DateStrLen));
  }

  AppendHeader(out, http::ContentTypeLower, http::ContentTypeTextPlain);

  char lenBuf[20];
  AppendHeader(out, http::ContentLengthLower,
               std::string_view(lenBuf, std::to_chars(lenBuf, lenBuf + sizeof(lenBuf), body.size()).ptr));

  AppendHeader(out, http::ConnectionLower, http::close);

  out.append(http::CRLF);
  out.append(body);
  return out;
}

}  // namespace tandem
