#include "tandem/message-head.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <variant>

#include "tandem/http-status-code.hpp"
#include "tandem/http-version.hpp"
#include "tandem/tchars.hpp"

namespace tandem {

MessageHead MessageHead::Request(std::string_view method, std::string_view target, http::Version version) {
  if (!IsToken(method)) {
    throw std::invalid_argument("HTTP method is not a valid token");
  }
  if (target.empty() || !std::ranges::all_of(target, [](unsigned char ch) { return IsTargetChar(ch); })) {
    throw std::invalid_argument("HTTP request target is empty or contains invalid characters");
  }
  MessageHead head;
  head._startLine = RequestLine{std::string(method), std::string(target), version};
  return head;
}

MessageHead MessageHead::Response(http::StatusCode status, std::string_view reason, http::Version version) {
  if (status < 100 || status > 999) {
    throw std::invalid_argument("HTTP status code must be in [100, 999]");
  }
  if (!std::ranges::all_of(reason, [](unsigned char ch) { return IsFieldContentChar(ch); })) {
    throw std::invalid_argument("HTTP reason phrase contains invalid characters");
  }
  MessageHead head;
  head._startLine = StatusLine{status, std::string(reason), version};
  return head;
}

const RequestLine& MessageHead::requestLine() const {
  const auto* requestLine = std::get_if<RequestLine>(&_startLine);
  if (requestLine == nullptr) {
    throw std::logic_error("message head is not a request");
  }
  return *requestLine;
}

RequestLine& MessageHead::requestLine() {
  return const_cast<RequestLine&>(static_cast<const MessageHead*>(this)->requestLine());
}

const StatusLine& MessageHead::statusLine() const {
  const auto* statusLine = std::get_if<StatusLine>(&_startLine);
  if (statusLine == nullptr) {
    throw std::logic_error("message head is not a response");
  }
  return *statusLine;
}

StatusLine& MessageHead::statusLine() {
  return const_cast<StatusLine&>(static_cast<const MessageHead*>(this)->statusLine());
}

std::string_view MessageHead::method() const noexcept {
  const auto* requestLine = std::get_if<RequestLine>(&_startLine);
  return requestLine == nullptr ? std::string_view{} : std::string_view(requestLine->method);
}

std::string_view MessageHead::target() const noexcept {
  const auto* requestLine = std::get_if<RequestLine>(&_startLine);
  return requestLine == nullptr ? std::string_view{} : std::string_view(requestLine->target);
}

http::StatusCode MessageHead::status() const noexcept {
  const auto* statusLine = std::get_if<StatusLine>(&_startLine);
  return statusLine == nullptr ? http::StatusCode{} : statusLine->status;
}

http::Version MessageHead::version() const noexcept {
  return std::visit([](const auto& startLine) { return startLine.version; }, _startLine);
}

void MessageHead::setVersion(http::Version version) noexcept {
  std::visit([version](auto& startLine) { startLine.version = version; }, _startLine);
}

}  // namespace tandem
