// Repository: StreamTap
// Component: Buffer
// Purpose: Array payload plus the engine timing metadata it arrived with.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_BUFFER_BUFFER_HPP_
#define STREAMTAP_BUFFER_BUFFER_HPP_

#include <cstdint>
#include <limits>

#include "streamtap/buffer/NDArray.hpp"

namespace streamtap::buffer {

// Matches GST_CLOCK_TIME_NONE and GST_BUFFER_OFFSET_NONE.
constexpr uint64_t kTimeUnset = std::numeric_limits<uint64_t>::max();

// One decoded buffer. Times are nanoseconds in the engine's running time.
struct Buffer {
  NDArray data;
  uint64_t pts = kTimeUnset;
  uint64_t dts = kTimeUnset;
  uint64_t duration = kTimeUnset;
  uint64_t offset = kTimeUnset;

  bool HasPts() const { return pts != kTimeUnset; }
  bool HasDts() const { return dts != kTimeUnset; }
};

}  // namespace streamtap::buffer

#endif  // STREAMTAP_BUFFER_BUFFER_HPP_
