#pragma once

#include <cstddef>
#include <string_view>

#include "ferry/string-trim.hpp"
#include "ferry/toupperlower.hpp"

namespace ferry {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Tells whether the comma separated list 'value' (as in Connection or Transfer-Encoding header values)
// holds 'token', ignoring case and optional whitespace around the elements.
// Transfer coding parameters (";q=...") are ignored.
constexpr bool CaseInsensitiveListContains(std::string_view value, std::string_view token) {
  while (!value.empty()) {
    const auto commaPos = value.find(',');
    std::string_view elem = value.substr(0, commaPos);
    const auto paramPos = elem.find(';');
    if (paramPos != std::string_view::npos) {
      elem = elem.substr(0, paramPos);
    }
    if (CaseInsensitiveEqual(TrimOws(elem), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return false;
}

struct CaseInsensitiveHashFunc {
  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    for (char ch : str) {
      hash ^= static_cast<std::size_t>(tolower(ch)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (hash << 6) +
              (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace ferry
