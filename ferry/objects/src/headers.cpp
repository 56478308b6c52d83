#include "ferry/headers.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <vector>

#include "ferry/http-header.hpp"
#include "ferry/string-equal-ignore-case.hpp"

namespace ferry::http {

Headers& Headers::append(std::string_view name, std::string_view value) {
  _headers.emplace_back(name, value);
  return *this;
}

Headers& Headers::set(std::string_view name, std::string_view value) {
  const auto sameName = [name](const Header& header) { return CaseInsensitiveEqual(header.name(), name); };
  auto it = std::ranges::find_if(_headers, sameName);
  if (it == _headers.end()) {
    return append(name, value);
  }
  it->setValue(value);
  // 'it' is the first occurrence, duplicates can only follow it
  _headers.erase(std::remove_if(std::next(it), _headers.end(), sameName), _headers.end());
  return *this;
}

std::size_t Headers::erase(std::string_view name) {
  return std::erase_if(_headers, [name](const Header& header) { return CaseInsensitiveEqual(header.name(), name); });
}

bool Headers::contains(std::string_view name) const noexcept { return get(name).has_value(); }

std::optional<std::string_view> Headers::get(std::string_view name) const noexcept {
  for (const Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name(), name)) {
      return header.value();
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> Headers::getAll(std::string_view name) const {
  std::vector<std::string_view> values;
  for (const Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name(), name)) {
      values.push_back(header.value());
    }
  }
  return values;
}

bool Headers::containsToken(std::string_view name, std::string_view token) const noexcept {
  return std::ranges::any_of(_headers, [name, token](const Header& header) {
    return CaseInsensitiveEqual(header.name(), name) && CaseInsensitiveListContains(header.value(), token);
  });
}

}  // namespace ferry::http
