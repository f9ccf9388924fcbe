// Repository: Reelforge
// Component: Rational Frame Rate Contract Tests
// Purpose: Frame-index timestamps and frame counts stay exact at rational rates.
// Copyright (c) 2025 Reelforge

#include <gtest/gtest.h>

#include <cstdint>

#include "reelforge/media/RationalFps.hpp"
#include "reelforge/pipeline/CompositionPipeline.hpp"

namespace reelforge::media {
namespace {

TEST(RationalFpsContract, NormalizesAndComparesStructurally) {
  RationalFps a(60, 2);
  EXPECT_EQ(a.num, 30);
  EXPECT_EQ(a.den, 1);
  EXPECT_TRUE(a == FPS_30);
  EXPECT_FALSE(RationalFps(0, 1).IsValid());
  EXPECT_FALSE(RationalFps(30, 0).IsValid());
}

TEST(RationalFpsContract, FrameDurationAt30) {
  EXPECT_EQ(FPS_30.FrameDurationUs(), 33333);
  EXPECT_EQ(FPS_30.FrameTimestampUs(0), 0);
  EXPECT_EQ(FPS_30.FrameTimestampUs(1), 33333);
  EXPECT_EQ(FPS_30.FrameTimestampUs(30), 1000000);
  EXPECT_EQ(FPS_30.FrameTimestampUs(300), 10000000);
}

TEST(RationalFpsContract, NtscTimestampsDoNotDrift) {
  // 30000/1001: frame 30000 lands exactly on 1001 seconds.
  EXPECT_EQ(FPS_2997.FrameTimestampUs(30000), 1001000000LL);
}

TEST(RationalFpsContract, TimestampsStrictlyIncrease) {
  int64_t last = -1;
  for (int64_t i = 0; i < 1000; ++i) {
    const int64_t ts = FPS_2997.FrameTimestampUs(i);
    ASSERT_GT(ts, last) << "frame " << i;
    last = ts;
  }
}

TEST(RationalFpsContract, TotalFramesRoundsUp) {
  EXPECT_EQ(pipeline::TotalFramesFor(10000000, FPS_30), 300);
  EXPECT_EQ(pipeline::TotalFramesFor(10010000, FPS_30), 301);
  EXPECT_EQ(pipeline::TotalFramesFor(2000000, FPS_30), 60);
  EXPECT_EQ(pipeline::TotalFramesFor(1, FPS_30), 1);
  EXPECT_EQ(pipeline::TotalFramesFor(0, FPS_30), 0);
  EXPECT_EQ(pipeline::TotalFramesFor(-5, FPS_30), 0);
}

TEST(RationalFpsContract, SecondsForFramesIsExact) {
  EXPECT_DOUBLE_EQ(FPS_30.SecondsForFrames(60), 2.0);
  EXPECT_DOUBLE_EQ(FPS_2997.SecondsForFrames(30000), 1001.0);
  EXPECT_DOUBLE_EQ(RationalFps().SecondsForFrames(60), 0.0);
}

TEST(RationalFpsContract, ParsesAndFormatsText) {
  ASSERT_TRUE(ParseRationalFps("30").has_value());
  EXPECT_EQ(*ParseRationalFps("30"), FPS_30);
  EXPECT_EQ(*ParseRationalFps("30000/1001"), FPS_2997);
  EXPECT_EQ(*ParseRationalFps("60/2"), FPS_30);

  EXPECT_FALSE(ParseRationalFps("").has_value());
  EXPECT_FALSE(ParseRationalFps("0").has_value());
  EXPECT_FALSE(ParseRationalFps("30/0").has_value());
  EXPECT_FALSE(ParseRationalFps("29.97").has_value());
  EXPECT_FALSE(ParseRationalFps("-30").has_value());
  EXPECT_FALSE(ParseRationalFps("99999999999999999999").has_value());

  EXPECT_EQ(FormatRationalFps(FPS_30), "30");
  EXPECT_EQ(FormatRationalFps(FPS_2997), "30000/1001");
  EXPECT_EQ(*ParseRationalFps(FormatRationalFps(FPS_2997)), FPS_2997);
}

}  // namespace
}  // namespace reelforge::media
