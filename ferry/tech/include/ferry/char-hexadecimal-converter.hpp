#pragma once

#include <cstddef>
#include <cstdint>

namespace ferry {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int from_hex_digit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

/// Number of hexadecimal digits needed to write 'value' (at least 1).
constexpr std::size_t nhexdigits(std::uint64_t value) {
  std::size_t nbDigits = 1;
  while (value >= 16U) {
    value >>= 4U;
    ++nbDigits;
  }
  return nbDigits;
}

/// Writes 'value' in lower case hexadecimal (no leading zeros) to 'buf', which should have space for
/// at least nhexdigits(value) chars.
/// Return a pointer to the char immediately positioned after the written digits.
/// Examples:
///  0     -> "0"
///  4096  -> "1000"
///  255   -> "ff"
constexpr char *to_lower_hex(std::uint64_t value, char *buf) {
  constexpr const char *const kHexits = "0123456789abcdef";

  char *end = buf + nhexdigits(value);
  for (char *pos = end; pos != buf;) {
    *--pos = kHexits[value & 0x0FU];
    value >>= 4U;
  }
  return end;
}

}  // namespace ferry
