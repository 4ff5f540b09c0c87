// Repository: StreamTap
// Component: RationalFps Contract Tests
// Purpose: Framerate parsing and exact timestamp arithmetic.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cstdint>

#include "streamtap/format/RationalFps.hpp"
#include "streamtap/runtime/Errors.hpp"

namespace streamtap::format::testing {
namespace {

TEST(RationalFpsContract, ParsesRationalAndInteger) {
  EXPECT_EQ(RationalFps::Parse("30/1"), RationalFps(30, 1));
  EXPECT_EQ(RationalFps::Parse("30000/1001"), FPS_2997);
  EXPECT_EQ(RationalFps::Parse("25"), RationalFps(25, 1));
}

TEST(RationalFpsContract, NormalizesOnConstruction) {
  const RationalFps fps(60, 2);
  EXPECT_EQ(fps.num, 30);
  EXPECT_EQ(fps.den, 1);
  EXPECT_EQ(fps.ToString(), "30/1");
}

TEST(RationalFpsContract, RejectsMalformedText) {
  EXPECT_THROW(RationalFps::Parse(""), FormatError);
  EXPECT_THROW(RationalFps::Parse("30fps"), FormatError);
  EXPECT_THROW(RationalFps::Parse("30 / 1"), FormatError);
  EXPECT_THROW(RationalFps::Parse("-30/1"), FormatError);
}

TEST(RationalFpsContract, RejectsNonPositiveRate) {
  EXPECT_THROW(RationalFps::Parse("0/1"), FormatError);
  EXPECT_THROW(RationalFps::Parse("30/0"), FormatError);
  EXPECT_FALSE(RationalFps(0, 1).IsValid());
}

TEST(RationalFpsContract, RejectsComponentsBeyondCapsRange) {
  EXPECT_THROW(RationalFps::Parse("4294967297/1"), FormatError);
  EXPECT_THROW(RationalFps::Parse("1/2147483648"), FormatError);
  EXPECT_EQ(RationalFps::Parse("2147483647/1"), RationalFps(2147483647, 1));
  // The range applies after reduction.
  EXPECT_EQ(RationalFps::Parse("4294967294/2"), RationalFps(2147483647, 1));
  EXPECT_FALSE(RationalFps(4294967297, 1).FitsCaps());
}

TEST(RationalFpsContract, FrameDurationIsExact) {
  EXPECT_EQ(RationalFps(10, 1).FrameDurationNs(), 100000000u);
  EXPECT_EQ(FPS_30.FrameDurationNs(), 33333333u);
  EXPECT_EQ(FPS_2997.FrameDurationNs(), 33366666u);
}

TEST(RationalFpsContract, FrameTimestampsDoNotAccumulateError) {
  // 30000 frames at 30000/1001 is exactly 1001 seconds.
  EXPECT_EQ(FPS_2997.DurationFromFramesNs(30000), 1001000000000ull);
  EXPECT_EQ(RationalFps(10, 1).DurationFromFramesNs(9), 900000000u);
  EXPECT_EQ(RationalFps(10, 1).DurationFromFramesNs(0), 0u);
}

TEST(RationalFpsContract, InvalidRateYieldsZeroDurations) {
  const RationalFps invalid;
  EXPECT_EQ(invalid.FrameDurationNs(), 0u);
  EXPECT_EQ(invalid.DurationFromFramesNs(100), 0u);
}

}  // namespace
}  // namespace streamtap::format::testing
