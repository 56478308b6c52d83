#include "ferry/response-head.hpp"

#include "ferry/http-constants.hpp"
#include "ferry/http-version.hpp"

namespace ferry {

bool ResponseHead::keepAlive() const noexcept {
  if (version == http::HTTP_1_0) {
    return headers.containsToken(http::Connection, http::keepalive);
  }
  return !headers.containsToken(http::Connection, http::close);
}

}  // namespace ferry
