#include "ferry/http-header.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "ferry/http-constants.hpp"
#include "ferry/string-trim.hpp"
#include "ferry/tchars.hpp"

namespace ferry::http {

Header::Header(std::string_view name, std::string_view value) : _nameLen(name.size()) {
  value = TrimOws(value);
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument("HTTP header name is invalid");
  }
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  _data.reserve(name.size() + HeaderSep.size() + value.size());
  _data.append(name);
  _data.append(HeaderSep);
  _data.append(value);
}

void Header::setValue(std::string_view value) {
  value = TrimOws(value);
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument("HTTP header value is invalid");
  }
  _data.resize(_nameLen + kSepLen);
  _data.append(value);
}

bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::none_of(value, [](unsigned char ch) {
    if (ch == '\t') {
      return false;
    }
    // CR, LF, NUL and the other control characters are forbidden, obs-text (>= 0x80) is tolerated.
    return ch < 0x20 || ch == 0x7F;
  });
}

}  // namespace ferry::http
