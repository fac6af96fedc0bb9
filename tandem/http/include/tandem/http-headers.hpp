#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "tandem/http-header.hpp"

namespace tandem {

// Ordered list of header fields of one message.
// Insertion order and duplicates are preserved (they matter on the wire), lookups ignore the case of names.
class HeaderList {
 public:
  using const_iterator = std::vector<http::Header>::const_iterator;

  HeaderList() noexcept = default;

  // Appends a header, keeping any existing one with the same name.
  // Throws std::invalid_argument if the name or value is invalid.
  HeaderList& append(std::string_view name, std::string_view value);

  // Replaces all headers named 'name' with a single one placed at the position of the first of them
  // (or appended if there were none).
  HeaderList& set(std::string_view name, std::string_view value);

  // Removes all headers named 'name', returning how many were removed.
  std::size_t erase(std::string_view name);

  // Returns the value of the first header named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // Returns the value of the first header named 'name', or an empty view.
  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return get(name).value_or(std::string_view{});
  }

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  [[nodiscard]] std::size_t count(std::string_view name) const noexcept;

  // Returns the values of all headers named 'name', in order.
  [[nodiscard]] std::vector<std::string_view> values(std::string_view name) const;

  // Tells whether 'token' appears in the comma separated lists of the headers named 'name' (case-insensitive),
  // e.g. containsToken("Connection", "close").
  [[nodiscard]] bool containsToken(std::string_view name, std::string_view token) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }

  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  void clear() noexcept { _headers.clear(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  bool operator==(const HeaderList&) const noexcept = default;

 private:
  std::vector<http::Header> _headers;
};

}  // namespace tandem
