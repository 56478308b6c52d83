#pragma once

#include "ferry/deadline.hpp"
#include "ferry/transport.hpp"

namespace ferry {

// Blocks until 'fd' is ready for the operation named by 'hint' (ReadReady or WriteReady), or until 'deadline'.
// Returns false if the deadline expired first.
// Throws std::system_error if poll(2) fails.
[[nodiscard]] bool WaitReady(int fd, TransportHint hint, const Deadline& deadline);

// Checks without blocking whether an idle connected socket is still usable for a new request.
// An idle HTTP/1.x connection should have nothing to read: readable data means either an orderly close
// (0 bytes) or unsolicited bytes, both making the connection unfit for reuse.
[[nodiscard]] bool IsIdleSocketAlive(int fd) noexcept;

}  // namespace ferry
