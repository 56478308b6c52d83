#pragma once

#include <string_view>

#include "ferry/http-header.hpp"

namespace ferry::http {

// Parse a single HTTP header field line (without its CRLF).
// Returns the (name, value) pair with the value stripped of surrounding optional whitespace,
// or an empty name if the line has no colon.
// The name is returned as is: whitespace before the colon is kept so that callers can reject it.
constexpr HeaderView ParseHeaderLine(std::string_view line) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    return {};
  }
  std::string_view value = line.substr(colonPos + 1);
  while (!value.empty() && IsHeaderWhitespace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsHeaderWhitespace(value.back())) {
    value.remove_suffix(1);
  }
  return {line.substr(0, colonPos), value};
}

}  // namespace ferry::http
