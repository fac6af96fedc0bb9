#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "tandem/http-headers.hpp"
#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"

namespace tandem {

enum class MessageKind : uint8_t { Request, Response };

struct RequestLine {
  std::string method;
  std::string target;
  http::Version version{http::HTTP_1_1};

  bool operator==(const RequestLine&) const noexcept = default;
};

struct StatusLine {
  http::StatusCode status{http::StatusCodeOK};
  // Empty reason is written as the standard phrase of the status code, if known.
  std::string reason;
  http::Version version{http::HTTP_1_1};

  bool operator==(const StatusLine&) const noexcept = default;
};

// Start line plus headers of a request or a response. The same type is used by both roles.
class MessageHead {
 public:
  // Default is a "200 OK" HTTP/1.1 response head.
  MessageHead() = default;

  // Builds a request head. Throws std::invalid_argument if method is not a token or target is empty / has whitespace.
  static MessageHead Request(std::string_view method, std::string_view target, http::Version version = http::HTTP_1_1);

  // Builds a response head. Throws std::invalid_argument if status is not in [100, 999] or reason has control chars.
  static MessageHead Response(http::StatusCode status, std::string_view reason = {},
                              http::Version version = http::HTTP_1_1);

  [[nodiscard]] MessageKind kind() const noexcept {
    return std::holds_alternative<RequestLine>(_startLine) ? MessageKind::Request : MessageKind::Response;
  }

  [[nodiscard]] bool isRequest() const noexcept { return kind() == MessageKind::Request; }

  // Accessors to the start line. Throw std::logic_error if the head is not of the expected kind.
  [[nodiscard]] const RequestLine& requestLine() const;
  [[nodiscard]] RequestLine& requestLine();
  [[nodiscard]] const StatusLine& statusLine() const;
  [[nodiscard]] StatusLine& statusLine();

  // Shortcuts. method() and target() are empty for responses, status() is 0 for requests.
  [[nodiscard]] std::string_view method() const noexcept;
  [[nodiscard]] std::string_view target() const noexcept;
  [[nodiscard]] http::StatusCode status() const noexcept;

  [[nodiscard]] http::Version version() const noexcept;

  void setVersion(http::Version version) noexcept;

  [[nodiscard]] const HeaderList& headers() const noexcept { return _headers; }
  [[nodiscard]] HeaderList& headers() noexcept { return _headers; }

  // Fluent append of a header.
  MessageHead& header(std::string_view name, std::string_view value) {
    _headers.append(name, value);
    return *this;
  }

  bool operator==(const MessageHead&) const noexcept = default;

 private:
  std::variant<StatusLine, RequestLine> _startLine;
  HeaderList _headers;
};

}  // namespace tandem
