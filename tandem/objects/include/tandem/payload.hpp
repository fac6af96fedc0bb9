#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace tandem {

// Owning storage of a fully resident message payload.
// The bytes are captured by move at construction time, so that no conversion copy is needed. view() returns a
// std::string_view referencing the internal data.
class Payload {
 public:
  Payload() noexcept = default;

  explicit Payload(std::string str) noexcept : _data(std::move(str)) {}

  [[nodiscard]] std::size_t size() const noexcept { return view().size(); }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  [[nodiscard]] std::string_view view() const noexcept;

  void clear() noexcept;

 private:
  std::variant<std::monostate, std::string> _data;
};

}  // namespace tandem
