#pragma once

#include <string_view>

#include "ferry/request.hpp"

namespace ferry {

struct FormatOptions {
  // Value of the User-Agent header added when the request has none. Empty for no default.
  std::string_view userAgent;
  // Value of the Accept-Encoding header added when the request has none. Empty for no default.
  std::string_view acceptEncoding;
};

// Normalizes a request before it is sent, and rejects requests that cannot be sent as is:
//  - only 'http' and 'https' targets are supported, and CONNECT is not an HTTP/1.0 method
//  - Host is set from the target authority when absent
//  - framing headers are made consistent with the body: Transfer-Encoding wins over Content-Length,
//    bodies of known size get a Content-Length, streams of unknown size are chunked (HTTP/1.1 only)
//  - default User-Agent and Accept-Encoding are added when configured.
// It is applied at each attempt and each redirect hop, and is idempotent.
// Throws HttpClientError (Build) on failure.
void FormatRequest(Request &request, const FormatOptions &options = {});

}  // namespace ferry
