#pragma once

#include <string_view>
#include <utility>

#include "ferry/headers.hpp"
#include "ferry/http-body.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/http-version.hpp"
#include "ferry/response-head.hpp"
#include "ferry/time-group.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// Response to a request: its decoded head and a lazily read body.
class Response {
 public:
  Response(ResponseHead head, HttpBody body, Uri uri, const TimeGroup &timeGroup)
      : _head(std::move(head)), _body(std::move(body)), _uri(std::move(uri)), _timeGroup(timeGroup) {}

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _head.statusCode; }

  [[nodiscard]] http::Version version() const noexcept { return _head.version; }

  [[nodiscard]] std::string_view reason() const noexcept { return _head.reason; }

  [[nodiscard]] const http::Headers &headers() const noexcept { return _head.headers; }

  [[nodiscard]] const ResponseHead &head() const noexcept { return _head; }

  [[nodiscard]] HttpBody &body() noexcept { return _body; }
  [[nodiscard]] const HttpBody &body() const noexcept { return _body; }

  // URI of the request that produced this response, after redirects.
  [[nodiscard]] const Uri &uri() const noexcept { return _uri; }

  [[nodiscard]] const TimeGroup &timeGroup() const noexcept { return _timeGroup; }

 private:
  ResponseHead _head;
  HttpBody _body;
  Uri _uri;
  TimeGroup _timeGroup;
};

}  // namespace ferry
