#pragma once

#include <algorithm>
#include <cstddef>
#include <limits>

#include "ferry/raw-chars.hpp"

namespace ferry {

// Bounds the plain bytes a decoder may append to 'out' during one decompressChunk call.
// Capacity grows geometrically, one decoder step at a time, but never beyond the remaining budget.
class OutputBudget {
 public:
  // A zero 'maxBytes' means no limit.
  OutputBudget(RawChars &out, std::size_t stepSize, std::size_t maxBytes)
      : _out(out),
        _stepSize(stepSize),
        _start(out.size()),
        _maxBytes(maxBytes == 0 ? std::numeric_limits<std::size_t>::max() - out.size() : maxBytes) {}

  // Makes room for the next decoder step.
  // Returns true if this step is the last one allowed: if the decoder still has output after it,
  // the budget is exhausted.
  bool reserveStep() {
    const std::size_t produced = _out.size() - _start;
    const bool lastStep = produced + _stepSize > _maxBytes;
    const std::size_t wanted = _out.size() + _stepSize;
    if (_out.capacity() < wanted) {
      const std::size_t ceiling = _start + _maxBytes;
      _out.reserve(lastStep ? ceiling : std::min(ceiling, std::max(wanted, 2UL * _out.capacity())));
    }
    return lastStep;
  }

 private:
  RawChars &_out;
  std::size_t _stepSize;
  std::size_t _start;
  std::size_t _maxBytes;
};

}  // namespace ferry
