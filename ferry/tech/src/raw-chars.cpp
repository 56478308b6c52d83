#include "ferry/raw-chars.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

namespace ferry {

RawChars::RawChars(size_type capacity) : _buf(static_cast<char *>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawChars::RawChars(std::string_view data) : RawChars(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawChars::RawChars(const RawChars &rhs) : RawChars(std::string_view(rhs)) {}

RawChars::RawChars(RawChars &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawChars &RawChars::operator=(const RawChars &rhs) {
  if (this != &rhs) {
    assign(rhs);
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

void RawChars::append(const char *data, size_type sz) {
  if (sz != 0) {
    ensureAvailableCapacityExponential(sz);
    std::memcpy(_buf + _size, data, sz);
    _size += sz;
  }
}

void RawChars::push_back(char ch) {
  ensureAvailableCapacityExponential(1U);
  _buf[_size++] = ch;
}

void RawChars::assign(std::string_view data) {
  _size = 0;
  append(data);
}

void RawChars::erase_front(size_type n) {
  assert(n <= _size);
  if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

void RawChars::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

void RawChars::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

void RawChars::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawChars::ensureAvailableCapacityExponential(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (required < _size) {
    throw std::bad_alloc();
  }
  if (_capacity < required) {
    const size_type doubled = (_capacity * 2U) + 1U;
    reallocUp(required < doubled ? doubled : required);
  }
}

void RawChars::swap(RawChars &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

void RawChars::reallocUp(size_type newCapacity) {
  char *newBuf = static_cast<char *>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace ferry
