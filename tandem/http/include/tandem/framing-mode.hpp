#pragma once

#include <cstdint>
#include <string_view>

namespace tandem {

// How the boundary of a message body is communicated on the wire.
// Resolved once per message, before any body byte is read or written.
struct FramingMode {
  enum class Kind : uint8_t {
    Length,         // Content-Length: exactly 'length' bytes follow the head
    Chunked,        // Transfer-Encoding: chunked
    CloseDelimited  // body ends when the stream closes (responses only)
  };

  static constexpr FramingMode Length(uint64_t length) noexcept { return {Kind::Length, length}; }
  static constexpr FramingMode Chunked() noexcept { return {Kind::Chunked, 0}; }
  static constexpr FramingMode CloseDelimited() noexcept { return {Kind::CloseDelimited, 0}; }

  // A determinate body ends without closing the stream, which is a precondition of persistent connections.
  [[nodiscard]] constexpr bool isDeterminate() const noexcept { return kind != Kind::CloseDelimited; }

  [[nodiscard]] constexpr bool isEmpty() const noexcept { return kind == Kind::Length && length == 0; }

  constexpr bool operator==(const FramingMode&) const noexcept = default;

  Kind kind{Kind::Length};
  uint64_t length{};
};

constexpr std::string_view FramingKindToStr(FramingMode::Kind kind) noexcept {
  switch (kind) {
    case FramingMode::Kind::Length:
      return "length";
    case FramingMode::Kind::Chunked:
      return "chunked";
    case FramingMode::Kind::CloseDelimited:
      return "close-delimited";
    default:
      return "unknown";
  }
}

}  // namespace tandem
