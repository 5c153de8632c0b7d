// Repository: Vidmark-player
// Component: FrameBuffer Contract Tests
// Purpose: Index contiguity, stale-frame reconciliation and adaptive sizing
// Copyright (c) 2025 Vidmark

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/FrameBuffer.hpp"
#include "vidmark/playback/LatencyTracker.hpp"

namespace vidmark::playback::testing {
namespace {

BufferedFrame MakeBuffered(int64_t index) {
  auto frame = std::make_shared<VideoFrame>();
  frame->width = 2;
  frame->height = 1;
  frame->data.assign(6, static_cast<uint8_t>(index));
  return BufferedFrame{frame, index};
}

// =============================================================================
// FB-001: Append keeps indices contiguous
// =============================================================================
TEST(FrameBufferTest, AppendAcceptsContiguousRun) {
  FrameBuffer buf(10);
  EXPECT_TRUE(buf.Append(MakeBuffered(5)));
  EXPECT_TRUE(buf.Append(MakeBuffered(6)));
  EXPECT_TRUE(buf.Append(MakeBuffered(7)));

  EXPECT_EQ(buf.Size(), 3);
  EXPECT_EQ(buf.Indices(), (std::vector<int64_t>{5, 6, 7}));
  EXPECT_TRUE(buf.IsContiguous());
  EXPECT_EQ(buf.NextContiguousIndex().value(), 8);
  EXPECT_EQ(buf.FrontIndex().value(), 5);
  EXPECT_EQ(buf.BackIndex().value(), 7);
}

TEST(FrameBufferTest, AppendRejectsGapsAndDuplicates) {
  FrameBuffer buf(10);
  ASSERT_TRUE(buf.Append(MakeBuffered(0)));
  EXPECT_FALSE(buf.Append(MakeBuffered(2)));  // gap
  EXPECT_FALSE(buf.Append(MakeBuffered(0)));  // duplicate
  EXPECT_FALSE(buf.Append(BufferedFrame{nullptr, 1}));
  EXPECT_FALSE(buf.Append(MakeBuffered(-1)));
  EXPECT_EQ(buf.Indices(), (std::vector<int64_t>{0}));
}

TEST(FrameBufferTest, AppendStopsAtHardCap) {
  FrameBuffer buf(3);
  for (int64_t i = 0; i < 3; ++i) {
    ASSERT_TRUE(buf.Append(MakeBuffered(i)));
  }
  EXPECT_FALSE(buf.Append(MakeBuffered(3)));
  EXPECT_EQ(buf.Size(), 3);
  EXPECT_EQ(buf.HardCapFrames(), 3);
}

TEST(FrameBufferTest, EmptyBufferHasNoIndices) {
  FrameBuffer buf;
  EXPECT_TRUE(buf.Empty());
  EXPECT_FALSE(buf.NextContiguousIndex().has_value());
  EXPECT_FALSE(buf.FrontIndex().has_value());
  EXPECT_TRUE(buf.IsContiguous());
}

// =============================================================================
// FB-002: PopFor reconciles the buffer with the playhead
// =============================================================================
TEST(FrameBufferTest, PopForReturnsExpectedFront) {
  FrameBuffer buf(10);
  for (int64_t i = 10; i < 13; ++i) buf.Append(MakeBuffered(i));

  BufferedFrame out;
  ASSERT_TRUE(buf.PopFor(10, out));
  EXPECT_EQ(out.source_index, 10);
  ASSERT_NE(out.frame, nullptr);
  EXPECT_EQ(out.frame->data[0], 10);
  EXPECT_EQ(buf.Indices(), (std::vector<int64_t>{11, 12}));
}

TEST(FrameBufferTest, PopForDiscardsStaleFrames) {
  FrameBuffer buf(10);
  for (int64_t i = 0; i < 5; ++i) buf.Append(MakeBuffered(i));

  // Playhead moved to 3 (e.g. stepping while paused).
  BufferedFrame out;
  ASSERT_TRUE(buf.PopFor(3, out));
  EXPECT_EQ(out.source_index, 3);
  EXPECT_EQ(buf.Indices(), (std::vector<int64_t>{4}));
}

TEST(FrameBufferTest, PopForClearsWhenFrontIsAhead) {
  FrameBuffer buf(10);
  for (int64_t i = 20; i < 25; ++i) buf.Append(MakeBuffered(i));

  BufferedFrame out;
  EXPECT_FALSE(buf.PopFor(18, out));
  EXPECT_TRUE(buf.Empty());
}

TEST(FrameBufferTest, PopForOnEmptyBuffer) {
  FrameBuffer buf;
  BufferedFrame out;
  EXPECT_FALSE(buf.PopFor(0, out));
}

TEST(FrameBufferTest, ClearDropsEverything) {
  FrameBuffer buf(10);
  for (int64_t i = 0; i < 4; ++i) buf.Append(MakeBuffered(i));
  buf.Clear();
  EXPECT_TRUE(buf.Empty());
  // Any index may start a new run after a clear.
  EXPECT_TRUE(buf.Append(MakeBuffered(100)));
}

// =============================================================================
// FB-003: Adaptive target size
// =============================================================================
TEST(FrameBufferTest, TargetSizeDefaultsWithoutSamples) {
  EngineConfig config;
  LatencyTracker latency;
  EXPECT_EQ(ComputeTargetSize(latency, 1000.0 / 30.0, config), 20);

  EngineConfig constrained = EngineConfig::Constrained();
  EXPECT_EQ(ComputeTargetSize(latency, 1000.0 / 30.0, constrained), 10);
}

TEST(FrameBufferTest, TargetSizeFollowsLatency) {
  EngineConfig config;
  LatencyTracker latency;
  // 0.25 s per decode at 62.5 ms frames: 0.25 / 0.0625 * 2 = 8.
  latency.Record(0.25);
  EXPECT_EQ(ComputeTargetSize(latency, 62.5, config), 8);

  // Window average (0.25 + 0.75) / 2 = 0.5 s: 16.
  latency.Record(0.75);
  EXPECT_EQ(ComputeTargetSize(latency, 62.5, config), 16);
}

TEST(FrameBufferTest, TargetSizeRoundsPartialFramesUp) {
  EngineConfig config;
  LatencyTracker latency;
  // 0.3 / 0.0625 * 2 = 9.6 frames of lookahead: keep 10.
  latency.Record(0.3);
  EXPECT_EQ(ComputeTargetSize(latency, 62.5, config), 10);
}

TEST(FrameBufferTest, TargetSizeClampedToBounds) {
  EngineConfig config;
  LatencyTracker fast;
  fast.Record(0.001);
  EXPECT_EQ(ComputeTargetSize(fast, 1000.0 / 30.0, config), config.min_buffer_size);

  LatencyTracker slow;
  slow.Record(2.0);
  EXPECT_EQ(ComputeTargetSize(slow, 1000.0 / 30.0, config), config.max_buffer_size);
}

}  // namespace
}  // namespace vidmark::playback::testing
