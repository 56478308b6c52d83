#pragma once

#include <string_view>
#include <utility>

#include "ferry/headers.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-version.hpp"
#include "ferry/request-body.hpp"
#include "ferry/time-group.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// An HTTP request to be sent by the Client.
// A Request is move-only as it owns its body, which may be a stream.
// The Client updates it in place while following redirects (target, method, headers and body).
class Request {
 public:
  // Throws HttpClientError (Build) if 'url' is not a valid absolute URI.
  Request(http::Method method, std::string_view url);

  Request(http::Method method, Uri uri);

  Request(const Request &) = delete;
  Request(Request &&) noexcept = default;
  Request &operator=(const Request &) = delete;
  Request &operator=(Request &&) noexcept = default;

  ~Request() = default;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  void setMethod(http::Method method) noexcept { _method = method; }

  [[nodiscard]] const Uri &uri() const noexcept { return _uri; }

  void setUri(Uri uri) { _uri = std::move(uri); }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  [[nodiscard]] http::Headers &headers() noexcept { return _headers; }
  [[nodiscard]] const http::Headers &headers() const noexcept { return _headers; }

  [[nodiscard]] RequestBody &body() noexcept { return _body; }

  void setBody(RequestBody body) noexcept { _body = std::move(body); }

  [[nodiscard]] TimeGroup &timeGroup() noexcept { return _timeGroup; }
  [[nodiscard]] const TimeGroup &timeGroup() const noexcept { return _timeGroup; }

  // Appends a header field. Throws HttpClientError (Build) if the name or the value is invalid.
  Request &withHeader(std::string_view name, std::string_view value);

  Request &withBody(RequestBody body) & noexcept {
    _body = std::move(body);
    return *this;
  }

  Request &&withBody(RequestBody body) && noexcept {
    _body = std::move(body);
    return std::move(*this);
  }

  Request &withVersion(http::Version version) noexcept {
    _version = version;
    return *this;
  }

 private:
  Uri _uri;
  http::Headers _headers;
  RequestBody _body;
  TimeGroup _timeGroup;
  http::Version _version{http::HTTP_1_1};
  http::Method _method;
};

}  // namespace ferry
