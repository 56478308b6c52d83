#pragma once

#include <optional>

#include "ferry/timedef.hpp"

namespace ferry {

// Timing record of one request attempt.
// Each point is written once per attempt, and the whole record is reset when an attempt is retried or redirected.
class TimeGroup {
 public:
  void setConnectStart(SteadyTimePoint tp = SteadyClock::now()) noexcept { _connectStart = tp; }
  void setConnectEnd(SteadyTimePoint tp = SteadyClock::now()) noexcept { _connectEnd = tp; }
  void setTransferStart(SteadyTimePoint tp = SteadyClock::now()) noexcept { _transferStart = tp; }
  void setTransferEnd(SteadyTimePoint tp = SteadyClock::now()) noexcept { _transferEnd = tp; }

  [[nodiscard]] std::optional<SteadyTimePoint> connectStart() const noexcept { return _connectStart; }
  [[nodiscard]] std::optional<SteadyTimePoint> connectEnd() const noexcept { return _connectEnd; }
  [[nodiscard]] std::optional<SteadyTimePoint> transferStart() const noexcept { return _transferStart; }
  [[nodiscard]] std::optional<SteadyTimePoint> transferEnd() const noexcept { return _transferEnd; }

  // Time spent obtaining the connection (zero-ish for a pooled one), if both points are known.
  [[nodiscard]] std::optional<SteadyDuration> connectDuration() const noexcept {
    if (_connectStart && _connectEnd) {
      return *_connectEnd - *_connectStart;
    }
    return std::nullopt;
  }

  // Time between the first request byte sent and the response head received, if both points are known.
  [[nodiscard]] std::optional<SteadyDuration> transferDuration() const noexcept {
    if (_transferStart && _transferEnd) {
      return *_transferEnd - *_transferStart;
    }
    return std::nullopt;
  }

  void reset() noexcept { *this = TimeGroup{}; }

 private:
  std::optional<SteadyTimePoint> _connectStart;
  std::optional<SteadyTimePoint> _connectEnd;
  std::optional<SteadyTimePoint> _transferStart;
  std::optional<SteadyTimePoint> _transferEnd;
};

}  // namespace ferry
