#pragma once

#include <cstddef>
#include <string_view>

namespace ferry {

/**
 * A growable char buffer with explicit size / capacity control.
 * Unlike std::string it never value-initializes the free capacity, which makes it suitable to be
 * handed directly to read(2), SSL_read_ex or decompression libraries writing into 'data() + size()'.
 * Growth is exponential.
 */
class RawChars {
 public:
  using value_type = char;
  using size_type = std::size_t;
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

  void append(const char *data, size_type sz);

  void append(std::string_view data) { append(data.data(), data.size()); }

  void push_back(char ch);

  void assign(std::string_view data);

  void clear() noexcept { _size = 0; }

  // Removes the first 'n' chars, shifting the remaining ones to the front.
  void erase_front(size_type n);

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  void ensureAvailableCapacityExponential(size_type availableCapacity);

  [[nodiscard]] char *data() noexcept { return _buf; }
  [[nodiscard]] const char *data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(RawChars &rhs) noexcept;

  char &operator[](size_type pos) { return _buf[pos]; }
  char operator[](size_type pos) const { return _buf[pos]; }

  operator std::string_view() const noexcept { return {_buf, _size}; }

  bool operator==(const RawChars &rhs) const noexcept { return std::string_view(*this) == std::string_view(rhs); }

 private:
  void reallocUp(size_type newCapacity);

  char *_buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawChars &lhs, RawChars &rhs) noexcept { lhs.swap(rhs); }

}  // namespace ferry
