#pragma once

#include <chrono>

#include "ferry/timedef.hpp"

namespace ferry {

// An absolute point in time after which a blocking operation gives up.
// A default constructed Deadline never expires.
class Deadline {
 public:
  Deadline() noexcept = default;

  explicit Deadline(SteadyTimePoint at) noexcept : _at(at) {}

  static Deadline Never() noexcept { return {}; }

  // Deadline 'timeout' from now. A zero or negative timeout means no deadline.
  static Deadline In(std::chrono::milliseconds timeout) noexcept {
    if (timeout <= std::chrono::milliseconds{0}) {
      return {};
    }
    return Deadline(SteadyClock::now() + timeout);
  }

  [[nodiscard]] bool isNever() const noexcept { return _at == SteadyTimePoint::max(); }

  [[nodiscard]] SteadyTimePoint at() const noexcept { return _at; }

  [[nodiscard]] bool expired(SteadyTimePoint now = SteadyClock::now()) const noexcept { return now >= _at; }

  // Remaining time in milliseconds suitable for poll(2): -1 for an infinite wait, 0 if expired,
  // rounded up otherwise so that a wait never returns just before the deadline.
  [[nodiscard]] int pollTimeoutMs(SteadyTimePoint now = SteadyClock::now()) const noexcept;

  [[nodiscard]] Deadline earliest(Deadline other) const noexcept { return other._at < _at ? other : *this; }

  bool operator==(const Deadline&) const noexcept = default;

 private:
  SteadyTimePoint _at{SteadyTimePoint::max()};
};

}  // namespace ferry
