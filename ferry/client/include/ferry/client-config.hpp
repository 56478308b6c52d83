#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/connector-config.hpp"
#include "ferry/decompression-config.hpp"
#include "ferry/http1-exchange.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/pool-config.hpp"
#include "ferry/redirect.hpp"
#include "ferry/response-decoder.hpp"

namespace ferry {

// Configuration of a Client.
struct ClientConfig {
  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  // Maximum time to obtain a connection (pooled or new, TLS handshake included). 0 means no limit.
  ClientConfig& withConnectTimeout(std::chrono::milliseconds value) {
    connectTimeout = value;
    return *this;
  }

  // Maximum duration of one exchange, from the first request byte to the last response body byte.
  // 0 means no limit.
  ClientConfig& withRequestTimeout(std::chrono::milliseconds value) {
    requestTimeout = value;
    return *this;
  }

  // Number of additional attempts after a retryable failure, for requests with a reusable body.
  ClientConfig& withRetryTimes(uint32_t value) {
    retryTimes = value;
    return *this;
  }

  ClientConfig& withRedirect(std::shared_ptr<RedirectPolicy> value) {
    redirect = std::move(value);
    return *this;
  }

  ClientConfig& withInterceptor(std::shared_ptr<Interceptor> value) {
    interceptor = std::move(value);
    return *this;
  }

  ClientConfig& withMaxHeaderBytes(std::size_t value) {
    maxHeaderBytes = value;
    return *this;
  }

  ClientConfig& withTransferBufferSize(std::size_t value) {
    transferBufferSize = value;
    return *this;
  }

  ClientConfig& withPool(PoolConfig value) {
    pool = value;
    return *this;
  }

  ClientConfig& withConnector(ConnectorConfig value) {
    connector = std::move(value);
    return *this;
  }

  ClientConfig& withDecompression(DecompressionConfig value) {
    decompression = value;
    return *this;
  }

  ClientConfig& withUserAgent(std::string_view value) {
    userAgent = value;
    return *this;
  }

  std::chrono::milliseconds connectTimeout{0};
  std::chrono::milliseconds requestTimeout{0};
  uint32_t retryTimes{0};
  std::shared_ptr<RedirectPolicy> redirect{Redirect::Limited()};
  std::shared_ptr<Interceptor> interceptor;
  // Maximum size of a response head.
  std::size_t maxHeaderBytes{ResponseDecoder::kDefaultMaxHeadBytes};
  // Size of the fixed temporary buffer used to write requests and read responses.
  std::size_t transferBufferSize{ExchangeOptions::kDefaultBufferSize};
  PoolConfig pool;
  // Used only when the client builds its own HttpConnector.
  ConnectorConfig connector;
  DecompressionConfig decompression;
  // Default User-Agent, for requests that do not set one. Empty for none.
  std::string userAgent;
};

}  // namespace ferry
