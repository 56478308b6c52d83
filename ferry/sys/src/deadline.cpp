#include "ferry/deadline.hpp"

#include <chrono>
#include <limits>

#include "ferry/timedef.hpp"

namespace ferry {

int Deadline::pollTimeoutMs(SteadyTimePoint now) const noexcept {
  if (isNever()) {
    return -1;
  }
  if (now >= _at) {
    return 0;
  }
  const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(_at - now).count();
  if (remaining > std::numeric_limits<int>::max()) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(remaining);
}

}  // namespace ferry
