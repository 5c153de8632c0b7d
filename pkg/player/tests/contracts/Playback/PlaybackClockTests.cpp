// Repository: Vidmark-player
// Component: PlaybackClock Contract Tests
// Purpose: Speed-scaled pacing, bounded frame skipping and sleep floor
// Copyright (c) 2025 Vidmark

#include <gtest/gtest.h>

#include <chrono>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/PlaybackClock.hpp"

namespace vidmark::playback::testing {
namespace {

constexpr double kFrame30 = 1000.0 / 30.0;

TEST(PlaybackClockTest, IntervalScalesWithSpeed) {
  PlaybackClock clock{EngineConfig()};
  clock.SetFrameDurationMs(kFrame30);

  EXPECT_NEAR(clock.TargetIntervalMs(1.0), 33.333, 0.001);
  EXPECT_NEAR(clock.TargetIntervalMs(2.0), 16.667, 0.001);
  EXPECT_NEAR(clock.TargetIntervalMs(0.5), 66.667, 0.001);
  // Non-positive speed falls back to nominal pacing.
  EXPECT_NEAR(clock.TargetIntervalMs(0.0), 33.333, 0.001);
}

// =============================================================================
// CLK-001: Speed 2.0, 33.33 ms frames, one 60 ms frame: skip 2
// =============================================================================
TEST(PlaybackClockTest, LateFrameAtDoubleSpeedSkipsTwo) {
  PlaybackClock clock{EngineConfig()};
  clock.SetFrameDurationMs(kFrame30);
  const double interval = clock.TargetIntervalMs(2.0);

  // Threshold is interval + 10 = 26.67 ms.
  EXPECT_EQ(clock.FramesToSkip(60.0, interval), 2);
  EXPECT_EQ(clock.FramesToSkip(26.0, interval), 0);
  EXPECT_EQ(clock.FramesToSkip(interval, interval), 0);
}

TEST(PlaybackClockTest, SkipCountNeverExceedsFive) {
  PlaybackClock clock{EngineConfig()};
  clock.SetFrameDurationMs(kFrame30);
  const double interval = clock.TargetIntervalMs(1.0);

  EXPECT_EQ(clock.FramesToSkip(10'000.0, interval), 5);
  EXPECT_EQ(clock.FramesToSkip(1e12, interval), 5);
  for (double elapsed = 0.0; elapsed < 2000.0; elapsed += 7.5) {
    int skip = clock.FramesToSkip(elapsed, interval);
    EXPECT_GE(skip, 0);
    EXPECT_LE(skip, 5);
  }
}

TEST(PlaybackClockTest, JustPastThresholdSkipsNothingUntilAFullFrameBehind) {
  PlaybackClock clock{EngineConfig()};
  clock.SetFrameDurationMs(kFrame30);
  const double interval = clock.TargetIntervalMs(1.0);

  // 45 ms is past 33.3 + 10 but not a whole frame behind.
  EXPECT_EQ(clock.FramesToSkip(45.0, interval), 0);
  EXPECT_EQ(clock.FramesToSkip(70.0, interval), 1);
}

TEST(PlaybackClockTest, SkippingDisabled) {
  EngineConfig config;
  config.frame_skip_enabled = false;
  PlaybackClock clock(config);
  clock.SetFrameDurationMs(kFrame30);
  EXPECT_EQ(clock.FramesToSkip(500.0, clock.TargetIntervalMs(1.0)), 0);
}

TEST(PlaybackClockTest, ConfiguredSkipBound) {
  EngineConfig config;
  config.max_skip_frames = 2;
  PlaybackClock clock(config);
  clock.SetFrameDurationMs(kFrame30);
  EXPECT_EQ(clock.FramesToSkip(500.0, clock.TargetIntervalMs(1.0)), 2);
}

// =============================================================================
// CLK-002: Sleep is the remaining interval, floored at 1 ms
// =============================================================================
TEST(PlaybackClockTest, SleepDurationRemainingInterval) {
  PlaybackClock clock{EngineConfig()};
  EXPECT_EQ(clock.SleepDuration(33.0, 3.0), std::chrono::microseconds(30'000));
  EXPECT_EQ(clock.SleepDuration(16.5, 0.0), std::chrono::microseconds(16'500));
}

TEST(PlaybackClockTest, SleepDurationFloorIsOneMillisecond) {
  PlaybackClock clock{EngineConfig()};
  EXPECT_EQ(clock.SleepDuration(16.0, 20.0), std::chrono::microseconds(1'000));
  EXPECT_EQ(clock.SleepDuration(16.0, 15.5), std::chrono::microseconds(1'000));
}

TEST(PlaybackClockTest, AnchorTracksLastFrameSlot) {
  PlaybackClock clock{EngineConfig()};
  const auto t0 = std::chrono::steady_clock::now();

  EXPECT_FALSE(clock.HasAnchor());
  EXPECT_DOUBLE_EQ(clock.ElapsedMs(t0 + std::chrono::milliseconds(500)), 0.0);

  clock.MarkFrameSlot(t0);
  EXPECT_TRUE(clock.HasAnchor());
  EXPECT_NEAR(clock.ElapsedMs(t0 + std::chrono::milliseconds(50)), 50.0, 1e-6);

  clock.ResetAnchor();
  EXPECT_FALSE(clock.HasAnchor());
  EXPECT_DOUBLE_EQ(clock.ElapsedMs(t0 + std::chrono::milliseconds(50)), 0.0);
}

}  // namespace
}  // namespace vidmark::playback::testing
