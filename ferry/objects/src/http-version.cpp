#include "ferry/http-version.hpp"

#include <string_view>

namespace ferry::http {

std::string_view Version::str() const noexcept { return minor == 0 ? "HTTP/1.0" : "HTTP/1.1"; }

bool ParseHttpVersion(std::string_view token, Version& out) {
  // "HTTP/" DIGIT "." DIGIT (RFC 9112 §2.3)
  if (token.size() != kHttpPrefix.size() + 3U || !token.starts_with(kHttpPrefix)) {
    return false;
  }
  const char majorCh = token[kHttpPrefix.size()];
  const char dot = token[kHttpPrefix.size() + 1U];
  const char minorCh = token[kHttpPrefix.size() + 2U];
  if (majorCh < '0' || majorCh > '9' || dot != '.' || minorCh < '0' || minorCh > '9') {
    return false;
  }
  out.major = static_cast<uint8_t>(majorCh - '0');
  out.minor = static_cast<uint8_t>(minorCh - '0');
  return true;
}

}  // namespace ferry::http
