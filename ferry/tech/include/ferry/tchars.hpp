#pragma once

#include <array>
#include <string_view>

namespace ferry {

namespace detail {

// token = 1*tchar (RFC 9110 §5.6.2)
inline constexpr std::array<bool, 256> kTokenChars = [] {
  std::array<bool, 256> table{};
  for (char ch = '0'; ch <= '9'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  for (char ch = 'a'; ch <= 'z'; ++ch) {
    table[static_cast<unsigned char>(ch)] = true;
    table[static_cast<unsigned char>(ch - 'a' + 'A')] = true;
  }
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  return table;
}();

}  // namespace detail

constexpr bool IsTokenChar(char ch) noexcept { return detail::kTokenChars[static_cast<unsigned char>(ch)]; }

// Tells whether 'str' is a non-empty token, as required for header field names and methods.
constexpr bool IsToken(std::string_view str) noexcept {
  if (str.empty()) {
    return false;
  }
  for (char ch : str) {
    if (!IsTokenChar(ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace ferry
