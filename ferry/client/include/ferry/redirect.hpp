#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "ferry/request.hpp"
#include "ferry/uri.hpp"

namespace ferry {

class Response;

// State of the redirect chain of one logical request.
struct RedirectInfo {
  // Number of redirects followed so far.
  uint32_t count{0};
  // URIs of the chain, starting with the original one.
  std::vector<Uri> visited;
};

enum class RedirectTrigger : uint8_t { Stop, NextLink };

// Decides whether a response is final or whether the request should be sent again elsewhere.
class RedirectPolicy {
 public:
  virtual ~RedirectPolicy() = default;

  // Returns Stop if 'response' is final. Returns NextLink after having re-pointed 'request' to the next location
  // (target, method, headers and body updated as needed).
  // Throws HttpClientError (Redirect) if the redirect cannot be followed (hop limit, loop, malformed Location).
  virtual RedirectTrigger redirect(Request &request, const Response &response, RedirectInfo &info) = 0;
};

// Standard redirect policy following 301, 302, 303, 307 and 308 responses that carry a Location header.
//  - 303, and 301 / 302 answering a POST, switch to GET without body.
//  - Host is recomputed for each hop, and credentials (Authorization, Proxy-Authorization, Cookie) are
//    not forwarded to another origin.
class Redirect final : public RedirectPolicy {
 public:
  static constexpr uint32_t kDefaultMaxHops = 10;

  // Never follows redirects: 3xx responses are returned to the caller.
  static std::shared_ptr<Redirect> None();

  // Follows at most 'maxHops' redirects per logical request.
  static std::shared_ptr<Redirect> Limited(uint32_t maxHops = kDefaultMaxHops);

  RedirectTrigger redirect(Request &request, const Response &response, RedirectInfo &info) override;

  [[nodiscard]] uint32_t maxHops() const noexcept { return _maxHops; }

  [[nodiscard]] bool follows() const noexcept { return _follow; }

 private:
  Redirect(uint32_t maxHops, bool follow) noexcept : _maxHops(maxHops), _follow(follow) {}

  uint32_t _maxHops;
  bool _follow;
};

}  // namespace ferry
