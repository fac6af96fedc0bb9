#pragma once

#include <string_view>

#include "tandem/http-status-code.hpp"

namespace tandem::http {

// NOTE ON CASE SENSITIVITY
// ------------------------
// Header field names are case-insensitive (RFC 9110). Names below are in their canonical form, except the framing
// headers that the codec emits itself, which are written in lower case. Tokens such as "chunked" or "keep-alive"
// are lower case to keep CaseInsensitiveEqual comparisons cheap.

// Version
inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view CONNECT = "CONNECT";

// Header field names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Date = "Date";

// Framing and connection headers as emitted by the codec.
inline constexpr std::string_view ContentLengthLower = "content-length";
inline constexpr std::string_view TransferEncodingLower = "transfer-encoding";
inline constexpr std::string_view ConnectionLower = "connection";
inline constexpr std::string_view DateLower = "date";
inline constexpr std::string_view ContentTypeLower = "content-type";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Last chunk of a chunked body without trailers.
inline constexpr std::string_view LastChunk = "0\r\n\r\n";

// Common header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view h100_continue = "100-continue";

// Preformatted interim response
inline constexpr std::string_view HTTP11_100_CONTINUE = "HTTP/1.1 100 Continue\r\n\r\n";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

// Reason phrases of the status codes the engine may emit on its own, plus the most common ones.
constexpr std::string_view ReasonPhraseFor(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeContinue:
      return "Continue";
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeExpectationFailed:
      return "Expectation Failed";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeBadGateway:
      return "Bad Gateway";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return {};
  }
}

}  // namespace tandem::http
