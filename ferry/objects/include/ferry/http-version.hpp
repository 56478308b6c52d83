#pragma once

#include <cstdint>
#include <string_view>

namespace ferry::http {

// RFC 9112 §2.3 HTTP version token representation
struct Version {
  bool operator==(const Version&) const noexcept = default;
  auto operator<=>(const Version&) const noexcept = default;

  // Returns the "HTTP/x.y" token for supported versions (HTTP/1.0 and HTTP/1.1).
  [[nodiscard]] std::string_view str() const noexcept;

  uint8_t major{1};
  uint8_t minor{1};
};

inline constexpr std::string_view kHttpPrefix = "HTTP/";

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Parse a textual HTTP version token (e.g. "HTTP/1.1") into Version.
// Returns true on success; false if format invalid.
bool ParseHttpVersion(std::string_view token, Version& out);

}  // namespace ferry::http
