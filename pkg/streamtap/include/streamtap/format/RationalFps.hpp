// Repository: StreamTap
// Component: RationalFps
// Purpose: Reduced rational frame rate with exact nanosecond arithmetic.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_FORMAT_RATIONAL_FPS_HPP_
#define STREAMTAP_FORMAT_RATIONAL_FPS_HPP_

#include <cstdint>
#include <string>

namespace streamtap::format {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// RationalFps holds a frame rate as num/den, always reduced.
// Invalid input (den == 0, non-positive) normalizes to 0/1, which reports
// IsValid() == false. A 0/1 rate is also what GStreamer uses for "variable
// or unknown" framerate in caps.
struct RationalFps {
  static constexpr int64_t kMaxCapsComponent = 2147483647;  // G_MAXINT

  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  // Caps carry framerate as a gint fraction. Keeping den within it also
  // keeps GST_SECOND * den inside 64 bits.
  constexpr bool FitsCaps() const {
    return num <= kMaxCapsComponent && den <= kMaxCapsComponent;
  }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  // Parses "N/D" or a bare integer "N" (meaning N/1). Whitespace around
  // the tokens is not accepted; GStreamer caps never carry any.
  // Throws FormatError on malformed input, a non-positive rate, or a
  // component above kMaxCapsComponent after reduction.
  static RationalFps Parse(const std::string& text);

  // Exact per-frame duration in nanoseconds, floor(1e9 * den / num).
  // Returns 0 when invalid.
  uint64_t FrameDurationNs() const;

  // Exact timestamp of frame `frames` in nanoseconds,
  // floor(frames * 1e9 * den / num), computed without intermediate overflow.
  // Returns 0 when invalid.
  uint64_t DurationFromFramesNs(uint64_t frames) const;

  // "N/D" as written in caps.
  std::string ToString() const;

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};

}  // namespace streamtap::format

#endif  // STREAMTAP_FORMAT_RATIONAL_FPS_HPP_
