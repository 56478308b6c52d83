#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ferry::http {

struct HeaderView {
  std::string_view name;
  std::string_view value;
};

// Represents a single HTTP header field.
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value. The value is trimmed.
  // Throws std::invalid_argument if the name or the value is invalid.
  Header(std::string_view name, std::string_view value);

  [[nodiscard]] std::string_view name() const noexcept { return std::string_view(_data).substr(0, _nameLen); }

  [[nodiscard]] std::string_view value() const noexcept {
    return std::string_view(_data).substr(_nameLen + kSepLen);
  }

  // Returns the raw header as "Name: Value".
  [[nodiscard]] std::string_view raw() const noexcept { return _data; }

  // Replaces the value, keeping the name.
  void setValue(std::string_view value);

  bool operator==(const Header&) const noexcept = default;

 private:
  static constexpr std::size_t kSepLen = 2;

  std::string _data;
  std::size_t _nameLen;
};

// RFC 9110 §5.6.3: optional whitespace (OWS) is zero or more spaces (SP) or horizontal tabs (HTAB).
constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Validates that a header name consists only of tchar characters as per RFC 9110 §5.6.2.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain any invalid characters.
// It must not contain CR, LF or NUL characters, but may contain HTAB, visible ASCII and obs-text.
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace ferry::http
