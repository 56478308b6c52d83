#include "ferry/request.hpp"

#include <exception>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "ferry/http-client-error.hpp"
#include "ferry/http-method.hpp"
#include "ferry/uri.hpp"

namespace ferry {

namespace {

Uri ParseRequestUri(std::string_view url) {
  auto uri = Uri::Parse(url);
  if (!uri) {
    throw HttpClientError(ErrorKind::Build, "invalid request URI");
  }
  return std::move(*uri);
}

}  // namespace

Request::Request(http::Method method, std::string_view url) : Request(method, ParseRequestUri(url)) {}

Request::Request(http::Method method, Uri uri) : _uri(std::move(uri)), _method(method) {}

Request &Request::withHeader(std::string_view name, std::string_view value) {
  try {
    _headers.append(name, value);
  } catch (const std::invalid_argument &ex) {
    throw HttpClientError(ErrorKind::Build, ex.what(), std::current_exception());
  }
  return *this;
}

}  // namespace ferry
