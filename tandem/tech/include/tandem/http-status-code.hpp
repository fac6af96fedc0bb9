#pragma once

#include <cstdint>

namespace tandem::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeContinue = 100;
inline constexpr StatusCode StatusCodeSwitchingProtocols = 101;
inline constexpr StatusCode StatusCodeEarlyHints = 103;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeAccepted = 202;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeNotModified = 304;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeRequestTimeout = 408;
inline constexpr StatusCode StatusCodeLengthRequired = 411;
inline constexpr StatusCode StatusCodePayloadTooLarge = 413;
inline constexpr StatusCode StatusCodeExpectationFailed = 417;
inline constexpr StatusCode StatusCodeRequestHeaderFieldsTooLarge = 431;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeNotImplemented = 501;
inline constexpr StatusCode StatusCodeBadGateway = 502;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;
inline constexpr StatusCode StatusCodeHTTPVersionNotSupported = 505;

/// 1xx responses, 204 and 304 never carry a body (RFC 9112 section 6.3).
constexpr bool IsBodylessStatus(StatusCode statusCode) noexcept {
  return (statusCode >= 100 && statusCode < 200) || statusCode == StatusCodeNoContent ||
         statusCode == StatusCodeNotModified;
}

constexpr bool IsInformationalStatus(StatusCode statusCode) noexcept { return statusCode >= 100 && statusCode < 200; }

}  // namespace tandem::http
