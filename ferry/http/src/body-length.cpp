#include "ferry/body-length.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

#include "ferry/headers.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/string-trim.hpp"

namespace ferry {

namespace {

std::optional<uint64_t> ParseSingleContentLength(std::string_view value) noexcept {
  value = TrimOws(value);
  if (value.empty()) {
    return std::nullopt;
  }
  uint64_t length = 0;
  const auto [ptr, errc] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (errc != std::errc{} || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return length;
}

}  // namespace

std::string_view BodyLengthKindToStr(BodyLength::Kind kind) noexcept {
  switch (kind) {
    case BodyLength::Kind::Zero:
      return "Zero";
    case BodyLength::Kind::Fixed:
      return "Fixed";
    case BodyLength::Kind::Chunked:
      return "Chunked";
    default:
      return "UntilClose";
  }
}

std::optional<uint64_t> ParseContentLength(std::string_view value) noexcept {
  std::optional<uint64_t> ret;
  // Some servers repeat the value, e.g. "42, 42" (RFC 9110 §8.6). It is accepted as long as all values agree.
  while (true) {
    const auto commaPos = value.find(',');
    const auto length = ParseSingleContentLength(value.substr(0, commaPos));
    if (!length || (ret && *ret != *length)) {
      return std::nullopt;
    }
    ret = length;
    if (commaPos == std::string_view::npos) {
      break;
    }
    value.remove_prefix(commaPos + 1);
  }
  return ret;
}

BodyLength ResolveBodyLength(http::Method requestMethod, http::StatusCode statusCode, const http::Headers &headers) {
  if (requestMethod == http::Method::HEAD || http::IsInformational(statusCode) ||
      statusCode == http::StatusCodeNoContent || statusCode == http::StatusCodeNotModified ||
      (requestMethod == http::Method::CONNECT && http::IsSuccess(statusCode))) {
    return BodyLength::Zero();
  }

  if (headers.containsToken(http::TransferEncoding, http::chunked)) {
    return BodyLength::Chunked();
  }

  std::optional<uint64_t> contentLength;
  for (std::string_view value : headers.getAll(http::ContentLength)) {
    const auto length = ParseContentLength(value);
    if (!length) {
      throw HttpClientError(ErrorKind::Protocol, ErrorPhase::Receive, "invalid Content-Length header value");
    }
    if (contentLength && *contentLength != *length) {
      throw HttpClientError(ErrorKind::Protocol, ErrorPhase::Receive, "conflicting Content-Length header values");
    }
    contentLength = length;
  }
  if (contentLength) {
    return BodyLength::Fixed(*contentLength);
  }
  return BodyLength::UntilClose();
}

}  // namespace ferry
