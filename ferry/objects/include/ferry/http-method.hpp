#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace ferry::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<MethodIdx>(method)]; }

// Method tokens are case-sensitive (RFC 9110 §9.1).
constexpr std::optional<Method> MethodFromStr(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (kMethodStrings[methodIdx] == str) {
      return static_cast<Method>(methodIdx);
    }
  }
  return std::nullopt;
}

}  // namespace ferry::http
