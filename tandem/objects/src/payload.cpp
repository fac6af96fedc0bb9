#include "tandem/payload.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace tandem {

std::string_view Payload::view() const noexcept {
  const std::string* str = std::get_if<std::string>(&_data);
  return str == nullptr ? std::string_view{} : std::string_view(*str);
}

void Payload::clear() noexcept { _data = std::monostate{}; }

}  // namespace tandem
