#pragma once

#include <memory>

#include "ferry/client-config.hpp"
#include "ferry/conn-pool.hpp"
#include "ferry/conn.hpp"
#include "ferry/connector.hpp"
#include "ferry/request.hpp"
#include "ferry/response.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// HTTP/1.x client.
//
// Each call to send runs one logical request: format the request, obtain a connection from the pool,
// run the exchange, then follow redirects as decided by the redirect policy.
// Retryable failures are retried up to 'retryTimes' times, provided the request body can be sent again.
// A Client can be shared by several threads, each request running on its calling thread.
class Client {
 public:
  // Uses an HttpConnector built from config.connector.
  // Throws std::invalid_argument if the configuration is invalid.
  explicit Client(ClientConfig config = {});

  // Uses 'connector' to establish new connections.
  // Throws std::invalid_argument if the configuration is invalid or 'connector' is null.
  Client(ClientConfig config, std::shared_ptr<Connector> connector);

  // Sends 'request' and returns the response head, its body being read on demand.
  // 'request' is updated in place by formatting and redirects.
  // Throws HttpClientError on failure.
  Response send(Request &request);

  Response send(Request &&request) { return send(request); }

  [[nodiscard]] const ClientConfig &config() const noexcept { return _config; }

  [[nodiscard]] ConnPool &pool() noexcept { return _pool; }

 private:
  Response sendFollowingRedirects(Request &request);

  Response sendOnce(Request &request);

  Conn connect(const Uri &uri);

  ClientConfig _config;
  ConnPool _pool;
};

}  // namespace ferry
