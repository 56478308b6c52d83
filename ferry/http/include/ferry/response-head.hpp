#pragma once

#include <string>

#include "ferry/headers.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/http-version.hpp"

namespace ferry {

// Status line and header fields of a response.
struct ResponseHead {
  // Tells whether the server allows the connection to be reused after this response:
  //  - HTTP/1.0 requires an explicit 'Connection: keep-alive'
  //  - HTTP/1.1 is persistent unless 'Connection: close' is present.
  [[nodiscard]] bool keepAlive() const noexcept;

  http::Version version;
  http::StatusCode statusCode{0};
  std::string reason;
  http::Headers headers;
};

}  // namespace ferry
