#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>

namespace tandem {

/**
 * A growable character buffer with explicit control over size and capacity.
 * It is the I/O staging area of the engine: bytes are read directly into its spare capacity
 * (ensureAvailableCapacity + addSize) and consumed from the front (erase_front).
 * Prefer std::string for general purpose text.
 */
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;
  using pointer = char *;
  using const_pointer = const char *;
  using iterator = char *;
  using const_iterator = const char *;

  RawChars() noexcept = default;

  explicit RawChars(size_type capacity);

  explicit RawChars(std::string_view data);

  RawChars(const RawChars &rhs);
  RawChars(RawChars &&rhs) noexcept;

  RawChars &operator=(const RawChars &rhs);
  RawChars &operator=(RawChars &&rhs) noexcept;

  ~RawChars();

  void unchecked_append(std::string_view data);

  void append(std::string_view data);

  void push_back(char ch);

  void assign(std::string_view data);

  void clear() noexcept { _size = 0; }

  // Removes the first n chars, shifting the remaining ones to the front.
  void erase_front(size_type n);

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Growth is exponential.
  void ensureAvailableCapacity(size_type availableCapacity);

  // Releases the memory if capacity exceeds 'maxCapacity' and the buffer is empty.
  void shrinkIfEmpty(size_type maxCapacity) noexcept;

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(RawChars &rhs) noexcept;

  char &operator[](size_type pos) { return _buf[pos]; }
  char operator[](size_type pos) const { return _buf[pos]; }

  [[nodiscard]] std::string_view view() const noexcept { return {_buf, _size}; }

  operator std::string_view() const noexcept { return view(); }

  bool operator==(const RawChars &rhs) const noexcept { return view() == rhs.view(); }

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawChars &lhs, RawChars &rhs) noexcept { lhs.swap(rhs); }

}  // namespace tandem
