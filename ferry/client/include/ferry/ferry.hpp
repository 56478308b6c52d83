// ferry Umbrella Header
//
// Include this single header to pull in the public HTTP client API:
//   - Client and its configuration (timeouts, retries, redirects, pool, proxy, TLS, decompression)
//   - Request / Response primitives (Request, RequestBody, Response, HttpBody)
//   - HTTP enums & helpers (methods, status codes, version, headers)
//   - Extension points (Connector, Interceptor, RedirectPolicy) and the error type
//
// Each re-exported header line is annotated with 'IWYU pragma: export' so that users including only
// <ferry/ferry.hpp> satisfy include-cleaner. Include the specific headers instead to minimize compile time.
//
// Usage Example:
//    #include <ferry/ferry.hpp>
//    using namespace ferry;
//    int main() {
//      Client client;
//      auto response = client.send(Request(http::Method::GET, "http://example.com/"));
//      std::cout << response.statusCode() << '\n' << response.body().readAll();
//    }

#pragma once

// Client & configuration
#include "ferry/client-config.hpp"         // IWYU pragma: export
#include "ferry/client.hpp"                // IWYU pragma: export
#include "ferry/connector-config.hpp"      // IWYU pragma: export
#include "ferry/decompression-config.hpp"  // IWYU pragma: export
#include "ferry/pool-config.hpp"           // IWYU pragma: export
#include "ferry/proxy-config.hpp"          // IWYU pragma: export
#include "ferry/tls-config.hpp"            // IWYU pragma: export

// Extension points
#include "ferry/connector.hpp"       // IWYU pragma: export
#include "ferry/http-connector.hpp"  // IWYU pragma: export
#include "ferry/interceptor.hpp"     // IWYU pragma: export
#include "ferry/redirect.hpp"        // IWYU pragma: export

// HTTP primitives
#include "ferry/http-body.hpp"          // IWYU pragma: export
#include "ferry/http-client-error.hpp"  // IWYU pragma: export
#include "ferry/request-body.hpp"       // IWYU pragma: export
#include "ferry/request.hpp"            // IWYU pragma: export
#include "ferry/response.hpp"           // IWYU pragma: export
#include "ferry/time-group.hpp"         // IWYU pragma: export
#include "ferry/uri.hpp"                // IWYU pragma: export

// HTTP protocol enums & helpers
#include "ferry/headers.hpp"           // IWYU pragma: export
#include "ferry/http-constants.hpp"    // IWYU pragma: export
#include "ferry/http-method.hpp"       // IWYU pragma: export
#include "ferry/http-status-code.hpp"  // IWYU pragma: export
#include "ferry/http-version.hpp"      // IWYU pragma: export
