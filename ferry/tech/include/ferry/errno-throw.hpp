#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>

namespace ferry {

// Throw std::system_error built from given error code with a formatted message.
template <typename... Args>
[[noreturn]] void throw_error_code(int err, fmt::format_string<Args...> fmt, Args&&... args) {
  throw std::system_error(std::error_code(err, std::generic_category()),
                          fmt::format(fmt, std::forward<Args>(args)...));
}

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("connect to {} failed", host);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  throw_error_code(savedErr, fmt, std::forward<Args>(args)...);
}

}  // namespace ferry
