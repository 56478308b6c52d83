#pragma once

#include <cstdint>

namespace ferry::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeContinue = 100;
inline constexpr StatusCode StatusCodeSwitchingProtocols = 101;
inline constexpr StatusCode StatusCodeEarlyHints = 103;

inline constexpr StatusCode StatusCodeOK = 200;
inline constexpr StatusCode StatusCodeCreated = 201;
inline constexpr StatusCode StatusCodeNoContent = 204;

inline constexpr StatusCode StatusCodeMultipleChoices = 300;
inline constexpr StatusCode StatusCodeMovedPermanently = 301;
inline constexpr StatusCode StatusCodeFound = 302;
inline constexpr StatusCode StatusCodeSeeOther = 303;
inline constexpr StatusCode StatusCodeNotModified = 304;
inline constexpr StatusCode StatusCodeTemporaryRedirect = 307;
inline constexpr StatusCode StatusCodePermanentRedirect = 308;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeProxyAuthenticationRequired = 407;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

constexpr bool IsInformational(StatusCode statusCode) { return statusCode >= 100 && statusCode < 200; }

constexpr bool IsSuccess(StatusCode statusCode) { return statusCode >= 200 && statusCode < 300; }

// Status codes for which a Location header asks the client to re-issue the request elsewhere.
constexpr bool IsRedirection(StatusCode statusCode) {
  return statusCode == StatusCodeMovedPermanently || statusCode == StatusCodeFound ||
         statusCode == StatusCodeSeeOther || statusCode == StatusCodeTemporaryRedirect ||
         statusCode == StatusCodePermanentRedirect;
}

}  // namespace ferry::http
