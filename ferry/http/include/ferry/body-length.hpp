#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "ferry/headers.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-status-code.hpp"

namespace ferry {

// Framing of a response body, decided once from the request method and the response head.
struct BodyLength {
  enum class Kind : uint8_t {
    Zero,       // no body at all
    Fixed,      // exactly 'length' bytes
    Chunked,    // chunked transfer coding, ends with the zero sized chunk
    UntilClose  // body ends when the server closes the connection
  };

  static constexpr BodyLength Zero() noexcept { return {Kind::Zero, 0}; }
  static constexpr BodyLength Fixed(uint64_t length) noexcept { return {Kind::Fixed, length}; }
  static constexpr BodyLength Chunked() noexcept { return {Kind::Chunked, 0}; }
  static constexpr BodyLength UntilClose() noexcept { return {Kind::UntilClose, 0}; }

  bool operator==(const BodyLength &) const noexcept = default;

  Kind kind;
  uint64_t length;
};

std::string_view BodyLengthKindToStr(BodyLength::Kind kind) noexcept;

// Determines the body framing of a response (RFC 9112 §6.3), in this order:
//  - HEAD requests, 1xx / 204 / 304 responses and 2xx responses to CONNECT have no body
//  - a Transfer-Encoding containing 'chunked' wins over any Content-Length
//  - a Content-Length gives a fixed size
//  - otherwise the body is delimited by the connection close.
// Throws HttpClientError (Protocol) if Content-Length is malformed or has conflicting values.
BodyLength ResolveBodyLength(http::Method requestMethod, http::StatusCode statusCode, const http::Headers &headers);

// Parses a Content-Length field value: 1*DIGIT, or a comma separated list of identical values.
// Returns std::nullopt if it is malformed.
std::optional<uint64_t> ParseContentLength(std::string_view value) noexcept;

}  // namespace ferry
