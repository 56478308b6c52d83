#pragma once

#include <cstddef>
#include <memory>

#include "ferry/conn.hpp"
#include "ferry/deadline.hpp"
#include "ferry/decompression-config.hpp"
#include "ferry/interceptor.hpp"
#include "ferry/request.hpp"
#include "ferry/response-decoder.hpp"
#include "ferry/response.hpp"

namespace ferry {

struct ExchangeOptions {
  static constexpr std::size_t kDefaultBufferSize = 16UL * 1024UL;

  // Bounds the whole exchange, body reading included.
  Deadline deadline;
  std::size_t maxHeadBytes{ResponseDecoder::kDefaultMaxHeadBytes};
  // Size of the temporary buffer used to write the request and to read the response.
  std::size_t bufferSize{kDefaultBufferSize};
  // Optional.
  std::shared_ptr<Interceptor> interceptor;
  DecompressionConfig decompression;
};

// Sends a formatted request on 'conn' and reads back the response head, over HTTP/1.x.
//
// The request head and body are written through one buffer of options.bufferSize bytes, then the response head
// is read back, skipping interim 1xx responses (except 101). The returned response owns the connection through
// its body.
// The connection is shut down when the response does not allow reuse (HTTP/1.0 without keep-alive,
// 'Connection: close', 101, 2xx to CONNECT, body delimited by close) or when the request asked for 'close'.
// On failure the connection is shut down and closed before the HttpClientError is thrown.
Response SendRequest(Conn conn, Request &request, const ExchangeOptions &options);

}  // namespace ferry
