#pragma once

#include <string_view>

#include "ferry/base-fd.hpp"
#include "ferry/deadline.hpp"

namespace ferry {

struct ConnectResult {
  BaseFd fd;
  int err{0};             // errno of the last failed attempt, if any
  bool timedOut{false};   // deadline expired before any address could be connected
  bool failure{false};
};

// Resolve host:port and connect to the first reachable returned address.
// The returned socket is non-blocking and already connected on success.
// Each pending non-blocking connect is awaited until 'deadline'; on failure the next address is tried.
// Parameters:
// - host: hostname or IP address to connect to
// - port: port number or service name
// - family: address family restriction (0 means unspecified)
ConnectResult ConnectTCP(std::string_view host, std::string_view port, const Deadline& deadline, int family = 0);

}  // namespace ferry
