#include "ferry/request-formatter.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ferry/body-length.hpp"
#include "ferry/headers.hpp"
#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-version.hpp"
#include "ferry/log.hpp"
#include "ferry/request.hpp"

namespace ferry {

namespace {

[[noreturn]] void ThrowBuildError(std::string_view msg) { throw HttpClientError(ErrorKind::Build, msg); }

bool MethodExpectsBody(http::Method method) {
  return method == http::Method::POST || method == http::Method::PUT || method == http::Method::PATCH;
}

void FormatFraming(Request &request) {
  http::Headers &headers = request.headers();
  const bool chunked = headers.containsToken(http::TransferEncoding, http::chunked);
  const bool isHttp10 = request.version() == http::HTTP_1_0;

  if (headers.contains(http::TransferEncoding)) {
    if (isHttp10) {
      ThrowBuildError("Transfer-Encoding is not supported in HTTP/1.0");
    }
    if (headers.erase(http::ContentLength) != 0) {
      log::debug("Removed Content-Length from a request with Transfer-Encoding");
    }
    if (!chunked) {
      ThrowBuildError("request Transfer-Encoding must include chunked");
    }
    return;
  }

  if (auto contentLength = headers.get(http::ContentLength)) {
    if (!ParseContentLength(*contentLength)) {
      ThrowBuildError("invalid Content-Length header value");
    }
    return;
  }

  const std::optional<uint64_t> size = request.body().knownSize();
  if (size) {
    if (*size != 0 || MethodExpectsBody(request.method())) {
      headers.append(http::ContentLength, std::to_string(*size));
    }
    return;
  }
  if (isHttp10) {
    ThrowBuildError("a body of unknown size cannot be sent in HTTP/1.0");
  }
  headers.append(http::TransferEncoding, http::chunked);
}

}  // namespace

void FormatRequest(Request &request, const FormatOptions &options) {
  const Uri &uri = request.uri();
  if (uri.scheme() != http::http && uri.scheme() != http::https) {
    ThrowBuildError("unsupported URI scheme, expected http or https");
  }
  if (uri.host().empty()) {
    ThrowBuildError("missing host in request URI");
  }
  if (request.version() != http::HTTP_1_0 && request.version() != http::HTTP_1_1) {
    ThrowBuildError("unsupported HTTP version");
  }
  if (request.method() == http::Method::CONNECT && request.version() == http::HTTP_1_0) {
    ThrowBuildError("Unknown METHOD in HTTP/1.0");
  }

  http::Headers &headers = request.headers();
  if (!headers.contains(http::Host)) {
    headers.append(http::Host, uri.authority());
  }

  FormatFraming(request);

  if (!options.userAgent.empty() && !headers.contains(http::UserAgent)) {
    headers.append(http::UserAgent, options.userAgent);
  }
  if (!options.acceptEncoding.empty() && !headers.contains(http::AcceptEncoding)) {
    headers.append(http::AcceptEncoding, options.acceptEncoding);
  }
}

}  // namespace ferry
