#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "ferry/http-header.hpp"

namespace ferry::http {

// Ordered, multi-valued collection of header fields.
// Lookups by name are case-insensitive, insertion order is preserved (it is the emission order).
class Headers {
 public:
  using const_iterator = std::vector<Header>::const_iterator;

  Headers() noexcept = default;

  // Appends a new field, keeping existing fields of the same name.
  // Throws std::invalid_argument if the name or the value is invalid.
  Headers& append(std::string_view name, std::string_view value);

  // Sets the value of 'name': the first existing field is updated in place and the others removed,
  // or a new field is appended if absent.
  Headers& set(std::string_view name, std::string_view value);

  // Removes all fields named 'name'. Returns the number of removed fields.
  std::size_t erase(std::string_view name);

  [[nodiscard]] bool contains(std::string_view name) const noexcept;

  // Returns the value of the first field named 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  // Returns the values of all fields named 'name', in order.
  [[nodiscard]] std::vector<std::string_view> getAll(std::string_view name) const;

  // Tells whether any field named 'name' holds 'token' in its comma separated list value.
  [[nodiscard]] bool containsToken(std::string_view name, std::string_view token) const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept { return _headers.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _headers.end(); }

  [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }

  [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }

  void clear() noexcept { _headers.clear(); }

  bool operator==(const Headers&) const noexcept = default;

 private:
  std::vector<Header> _headers;
};

}  // namespace ferry::http
