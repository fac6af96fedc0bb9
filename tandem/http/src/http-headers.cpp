#include "tandem/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "tandem/http-header.hpp"
#include "tandem/string-equal-ignore-case.hpp"

namespace tandem {

HeaderList& HeaderList::append(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

HeaderList& HeaderList::set(std::string_view name, std::string_view value) {
  http::Header header(name, value);
  const auto sameName = [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name(), name); };
  auto first = std::ranges::find_if(_headers, sameName);
  if (first == _headers.end()) {
    _headers.push_back(std::move(header));
    return *this;
  }
  *first = std::move(header);
  _headers.erase(std::remove_if(std::next(first), _headers.end(), sameName), _headers.end());
  return *this;
}

std::size_t HeaderList::erase(std::string_view name) {
  return std::erase_if(_headers, [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name(), name); });
}

std::optional<std::string_view> HeaderList::get(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name(), name)) {
      return header.value();
    }
  }
  return std::nullopt;
}

std::size_t HeaderList::count(std::string_view name) const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_headers, [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name(), name); }));
}

std::vector<std::string_view> HeaderList::values(std::string_view name) const {
  std::vector<std::string_view> ret;
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name(), name)) {
      ret.push_back(header.value());
    }
  }
  return ret;
}

bool HeaderList::containsToken(std::string_view name, std::string_view token) const noexcept {
  return std::ranges::any_of(_headers, [name, token](const http::Header& hdr) {
    return CaseInsensitiveEqual(hdr.name(), name) && ListContainsTokenIgnoreCase(hdr.value(), token);
  });
}

}  // namespace tandem
