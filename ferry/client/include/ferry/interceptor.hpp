#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/http-client-error.hpp"
#include "ferry/request.hpp"
#include "ferry/stream.hpp"

namespace ferry {

class Response;

// Observation hooks called along each exchange. The default implementations do nothing.
// Hooks run on the thread sending the request and may abort the exchange by throwing.
// A HttpClientError is propagated as is, any other exception is reported as ErrorKind::Other.
class Interceptor {
 public:
  virtual ~Interceptor() = default;

  // A new connection has been established (not called for pooled connections).
  virtual void onConnection([[maybe_unused]] const ConnDetail &detail) {}

  // The request is about to be encoded.
  virtual void onRequest([[maybe_unused]] const Request &request) {}

  // Bytes about to be written to the connection.
  virtual void onOutboundBytes([[maybe_unused]] std::string_view bytes) {}

  // Bytes just read from the connection.
  virtual void onInboundBytes([[maybe_unused]] std::string_view bytes) {}

  // The response head has been decoded, its body is not read yet.
  virtual void onResponse([[maybe_unused]] const Response &response) {}
};

template <class Func>
void RunInterceptorHook(ErrorPhase phase, Func &&func) {
  try {
    std::forward<Func>(func)();
  } catch (const HttpClientError &) {
    throw;
  } catch (const std::exception &ex) {
    throw HttpClientError(ErrorKind::Other, phase, std::string("interceptor failed: ") + ex.what(),
                          std::current_exception());
  }
}

}  // namespace ferry
