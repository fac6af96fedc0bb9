#include "tandem/raw-chars.hpp"

#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tandem {

RawChars::RawChars(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) { unchecked_append(data); }

RawChars::RawChars(const RawChars &rhs) : RawChars(rhs.view()) {}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    assign(rhs.view());
  }
  return *this;
}

RawChars &RawChars::operator=(RawChars &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawChars::~RawChars() { std::free(_buf); }

void RawChars::unchecked_append(std::string_view data) {
  if (!data.empty()) {
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void RawChars::append(std::string_view data) {
  ensureAvailableCapacity(data.size());
  unchecked_append(data);
}

void RawChars::push_back(char ch) {
  ensureAvailableCapacity(1U);
  _buf[_size++] = ch;
}

void RawChars::assign(std::string_view data) {
  _size = 0;
  append(data);
}

void RawChars::erase_front(size_type n) {
  if (n > _size) {
    throw std::out_of_range("RawChars::erase_front beyond size");
  }
  if (n == _size) {
    _size = 0;
  } else if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

void RawChars::setSize(size_type newSize) {
  if (newSize > _capacity) {
    throw std::out_of_range("RawChars::setSize beyond capacity");
  }
  _size = newSize;
}

void RawChars::addSize(size_type delta) { setSize(_size + delta); }

void RawChars::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacity(size_type availableCapacity) {
  static constexpr size_type kMaxCapacity = std::numeric_limits<size_type>::max() / 2U;
  if (availableCapacity > kMaxCapacity - _size) {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    const size_type doubled = (_capacity * 2U) + 1U;
    reallocUp(required < doubled ? doubled : required);
  }
}

void RawChars::shrinkIfEmpty(size_type maxCapacity) noexcept {
  if (_size == 0 && _capacity > maxCapacity) {
    std::free(_buf);
    _buf = nullptr;
    _capacity = 0;
  }
}

void RawChars::swap(RawChars &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

void RawChars::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace tandem
