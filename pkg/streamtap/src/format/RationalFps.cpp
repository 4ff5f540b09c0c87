// Repository: StreamTap
// Component: RationalFps
// Purpose: Framerate parsing and exact nanosecond scaling.
// Copyright (c) 2025 RetroVue

#include "streamtap/format/RationalFps.hpp"

#include <gst/gst.h>

#include <regex>
#include <stdexcept>

#include "streamtap/runtime/Errors.hpp"

namespace streamtap::format {

namespace {

int64_t ParseComponent(const std::string& digits, const std::string& text) {
  try {
    return std::stoll(digits);
  } catch (const std::out_of_range&) {
    throw FormatError("framerate out of range: '" + text + "'");
  }
}

}  // namespace

RationalFps RationalFps::Parse(const std::string& text) {
  static const std::regex kRational(R"((\d+)/(\d+))");
  static const std::regex kInteger(R"((\d+))");

  std::smatch match;
  RationalFps fps;
  if (std::regex_match(text, match, kRational)) {
    fps = RationalFps(ParseComponent(match[1].str(), text),
                      ParseComponent(match[2].str(), text));
  } else if (std::regex_match(text, match, kInteger)) {
    fps = RationalFps(ParseComponent(match[1].str(), text), 1);
  } else {
    throw FormatError("malformed framerate: '" + text + "' (expected N/D)");
  }

  if (!fps.IsValid()) {
    throw FormatError("framerate must be positive: '" + text + "'");
  }
  if (!fps.FitsCaps()) {
    throw FormatError("framerate does not fit a caps fraction: '" + text + "'");
  }
  return fps;
}

uint64_t RationalFps::FrameDurationNs() const {
  return DurationFromFramesNs(1);
}

uint64_t RationalFps::DurationFromFramesNs(uint64_t frames) const {
  if (!IsValid()) return 0;
  // gst_util_uint64_scale keeps 128-bit intermediates, so long sessions at
  // 30000/1001 do not overflow or accumulate rounding error.
  return gst_util_uint64_scale(frames, GST_SECOND * static_cast<uint64_t>(den),
                               static_cast<uint64_t>(num));
}

std::string RationalFps::ToString() const {
  return std::to_string(num) + "/" + std::to_string(den);
}

}  // namespace streamtap::format
