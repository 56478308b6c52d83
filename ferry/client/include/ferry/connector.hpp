#pragma once

#include <memory>

#include "ferry/deadline.hpp"
#include "ferry/stream.hpp"
#include "ferry/uri.hpp"

namespace ferry {

// Establishes transport streams to origins. Implementations must be usable from several threads at once.
class Connector {
 public:
  virtual ~Connector() = default;

  // Establishes a new stream to the origin (scheme, host, port) of 'uri'.
  // Throws HttpClientError (Connect) on failure, HttpClientError (Timeout) if the deadline elapses first.
  virtual std::unique_ptr<Stream> connect(const Uri &uri, const Deadline &deadline) = 0;
};

}  // namespace ferry
