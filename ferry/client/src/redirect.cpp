#include "ferry/redirect.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/http-client-error.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-method.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/log.hpp"
#include "ferry/request-body.hpp"
#include "ferry/request.hpp"
#include "ferry/response.hpp"
#include "ferry/uri.hpp"

namespace ferry {

namespace {

constexpr std::array kCredentialHeaders{http::Authorization, http::ProxyAuthorization, http::Cookie};

constexpr std::array kBodyHeaders{http::ContentLength, http::TransferEncoding, http::ContentType,
                                  http::ContentEncoding};

bool SwitchesToGet(http::StatusCode statusCode, http::Method method) {
  if (statusCode == http::StatusCodeSeeOther) {
    return method != http::Method::HEAD && method != http::Method::GET;
  }
  return method == http::Method::POST &&
         (statusCode == http::StatusCodeMovedPermanently || statusCode == http::StatusCodeFound);
}

HttpClientError RedirectError(std::string_view message) {
  return {ErrorKind::Redirect, ErrorPhase::Receive, message};
}

}  // namespace

std::shared_ptr<Redirect> Redirect::None() { return std::shared_ptr<Redirect>(new Redirect(0, false)); }

std::shared_ptr<Redirect> Redirect::Limited(uint32_t maxHops) {
  return std::shared_ptr<Redirect>(new Redirect(maxHops, true));
}

RedirectTrigger Redirect::redirect(Request &request, const Response &response, RedirectInfo &info) {
  if (!_follow || !http::IsRedirection(response.statusCode())) {
    return RedirectTrigger::Stop;
  }
  const auto location = response.headers().get(http::Location);
  if (!location) {
    return RedirectTrigger::Stop;
  }

  auto target = request.uri().resolve(*location);
  if (!target || (target->scheme() != http::http && target->scheme() != http::https) || target->host().empty()) {
    throw RedirectError("malformed Location '" + std::string(*location) + "'");
  }
  if (info.count >= _maxHops) {
    throw RedirectError("too many redirects (limit is " + std::to_string(_maxHops) + ')');
  }
  if (info.visited.empty()) {
    info.visited.push_back(request.uri());
  }
  if (std::ranges::find(info.visited, *target) != info.visited.end()) {
    throw RedirectError("redirect loop detected at " + target->str());
  }

  auto &headers = request.headers();
  if (SwitchesToGet(response.statusCode(), request.method())) {
    request.setMethod(http::Method::GET);
    request.setBody(RequestBody::Empty());
    for (auto name : kBodyHeaders) {
      headers.erase(name);
    }
  }
  headers.erase(http::Host);
  if (!target->sameOrigin(request.uri())) {
    std::size_t nbDropped = 0;
    for (auto name : kCredentialHeaders) {
      nbDropped += headers.erase(name);
    }
    if (nbDropped != 0) {
      log::warn("Redirect to another origin {}: {} credential header(s) dropped", target->str(), nbDropped);
    }
  }

  ++info.count;
  info.visited.push_back(*target);
  log::debug("Following {} redirect #{} to {}", response.statusCode(), info.count, target->str());
  request.setUri(std::move(*target));
  return RedirectTrigger::NextLink;
}

}  // namespace ferry
