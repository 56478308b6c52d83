#include "ferry/uri.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "ferry/http-constants.hpp"
#include "ferry/toupperlower.hpp"

namespace ferry {

namespace {

constexpr bool IsAlpha(char ch) { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z'); }

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool IsSchemeChar(char ch) { return IsAlpha(ch) || IsDigit(ch) || ch == '+' || ch == '-' || ch == '.'; }

// Characters that can never appear unencoded in a URI we put on the wire.
constexpr bool IsForbiddenUriChar(char ch) {
  const auto uc = static_cast<unsigned char>(ch);
  return uc <= 0x20 || uc == 0x7F || ch == '"' || ch == '<' || ch == '>' || ch == '\\' || ch == '^' || ch == '`' ||
         ch == '{' || ch == '|' || ch == '}';
}

std::string ToLower(std::string_view str) {
  std::string ret(str);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return tolower(ch); });
  return ret;
}

// Returns the length of the scheme (including ':') if 'str' starts with one, 0 otherwise.
std::size_t SchemeLen(std::string_view str) {
  if (str.empty() || !IsAlpha(str.front())) {
    return 0;
  }
  for (std::size_t pos = 1; pos < str.size(); ++pos) {
    if (str[pos] == ':') {
      return pos + 1;
    }
    if (!IsSchemeChar(str[pos])) {
      return 0;
    }
  }
  return 0;
}

std::string_view StripFragment(std::string_view str) { return str.substr(0, str.find('#')); }

}  // namespace

uint16_t DefaultPort(std::string_view scheme) noexcept {
  if (scheme == http::http) {
    return http::kDefaultHttpPort;
  }
  if (scheme == http::https) {
    return http::kDefaultHttpsPort;
  }
  return 0;
}

std::optional<Uri> Uri::Parse(std::string_view str) {
  str = StripFragment(str);
  if (std::ranges::any_of(str, IsForbiddenUriChar)) {
    return std::nullopt;
  }
  const std::size_t schemeLen = SchemeLen(str);
  if (schemeLen == 0 || !str.substr(schemeLen).starts_with("//")) {
    return std::nullopt;
  }

  Uri uri;
  uri._scheme = ToLower(str.substr(0, schemeLen - 1));
  str.remove_prefix(schemeLen + 2);

  const auto authorityEnd = str.find_first_of("/?");
  std::string_view authority = str.substr(0, authorityEnd);
  str.remove_prefix(authority.size());

  // userinfo is never sent on the wire, it is dropped
  const auto atPos = authority.rfind('@');
  if (atPos != std::string_view::npos) {
    authority.remove_prefix(atPos + 1);
  }

  std::string_view hostPart;
  std::string_view portPart;
  if (authority.starts_with('[')) {
    const auto closePos = authority.find(']');
    if (closePos == std::string_view::npos) {
      return std::nullopt;
    }
    hostPart = authority.substr(1, closePos - 1);
    const std::string_view rest = authority.substr(closePos + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return std::nullopt;
      }
      portPart = rest.substr(1);
    }
    if (hostPart.find(':') == std::string_view::npos) {
      return std::nullopt;
    }
  } else {
    const auto colonPos = authority.find(':');
    hostPart = authority.substr(0, colonPos);
    if (colonPos != std::string_view::npos) {
      portPart = authority.substr(colonPos + 1);
    }
    if (hostPart.find_first_of("[]") != std::string_view::npos) {
      return std::nullopt;
    }
  }
  if (hostPart.empty()) {
    return std::nullopt;
  }
  uri._host = ToLower(hostPart);

  uri._port = DefaultPort(uri._scheme);
  if (!portPart.empty()) {
    if (!std::ranges::all_of(portPart, IsDigit)) {
      return std::nullopt;
    }
    uint16_t port = 0;
    const auto [ptr, errc] = std::from_chars(portPart.data(), portPart.data() + portPart.size(), port);
    if (errc != std::errc{} || port == 0) {
      return std::nullopt;
    }
    uri._port = port;
    uri._explicitPort = true;
  }

  const auto queryPos = str.find('?');
  uri._path = std::string(str.substr(0, queryPos));
  if (queryPos != std::string_view::npos) {
    uri._hasQuery = true;
    uri._query = std::string(str.substr(queryPos + 1));
  }
  return uri;
}

std::optional<std::string_view> Uri::query() const noexcept {
  if (!_hasQuery) {
    return std::nullopt;
  }
  return std::string_view(_query);
}

bool Uri::isHttps() const noexcept { return _scheme == http::https; }

std::string Uri::originForm() const {
  std::string ret = _path.empty() ? std::string("/") : _path;
  if (_hasQuery) {
    ret.push_back('?');
    ret.append(_query);
  }
  return ret;
}

std::string Uri::authority() const {
  std::string ret;
  if (isIpv6Host()) {
    ret.push_back('[');
    ret.append(_host);
    ret.push_back(']');
  } else {
    ret = _host;
  }
  if (_port != DefaultPort(_scheme)) {
    ret.push_back(':');
    ret.append(std::to_string(_port));
  }
  return ret;
}

std::string Uri::hostAndPort() const {
  std::string ret = isIpv6Host() ? "[" + _host + "]" : _host;
  ret.push_back(':');
  ret.append(std::to_string(_port));
  return ret;
}

std::string Uri::absoluteForm() const {
  std::string ret = _scheme;
  ret.append("://");
  ret.append(authority());
  ret.append(originForm());
  return ret;
}

bool Uri::sameOrigin(const Uri &other) const noexcept {
  return _scheme == other._scheme && _host == other._host && _port == other._port;
}

std::optional<Uri> Uri::resolve(std::string_view reference) const {
  reference = StripFragment(reference);
  if (std::ranges::any_of(reference, IsForbiddenUriChar)) {
    return std::nullopt;
  }
  if (SchemeLen(reference) != 0) {
    return Parse(reference);
  }
  if (reference.starts_with("//")) {
    std::string absolute = _scheme;
    absolute.push_back(':');
    absolute.append(reference);
    return Parse(absolute);
  }

  Uri target = *this;
  if (reference.empty()) {
    return target;
  }

  const auto queryPos = reference.find('?');
  const std::string_view refPath = reference.substr(0, queryPos);
  target._hasQuery = queryPos != std::string_view::npos;
  target._query = target._hasQuery ? std::string(reference.substr(queryPos + 1)) : std::string();

  if (refPath.empty()) {
    // query only reference: keep the base path
    if (!target._hasQuery) {
      target._hasQuery = _hasQuery;
      target._query = _query;
    }
    return target;
  }
  if (refPath.starts_with('/')) {
    target._path = RemoveDotSegments(refPath);
    return target;
  }

  // merge (RFC 3986 §5.2.3)
  std::string merged;
  if (_path.empty()) {
    merged = "/";
  } else {
    merged = _path.substr(0, _path.rfind('/') + 1);
  }
  merged.append(refPath);
  target._path = RemoveDotSegments(merged);
  return target;
}

std::string RemoveDotSegments(std::string_view path) {
  std::string output;
  while (!path.empty()) {
    if (path.starts_with("../")) {
      path.remove_prefix(3);
    } else if (path.starts_with("./")) {
      path.remove_prefix(2);
    } else if (path.starts_with("/./")) {
      path.remove_prefix(2);
    } else if (path == "/.") {
      path = "/";
    } else if (path.starts_with("/../") || path == "/..") {
      path = path.size() == 3 ? std::string_view("/") : path.substr(3);
      const auto lastSlash = output.rfind('/');
      output.resize(lastSlash == std::string::npos ? 0 : lastSlash);
    } else if (path == "." || path == "..") {
      path = {};
    } else {
      const auto nextSlash = path.find('/', 1);
      const std::string_view segment = path.substr(0, nextSlash);
      output.append(segment);
      path.remove_prefix(segment.size());
    }
  }
  return output;
}

}  // namespace ferry
