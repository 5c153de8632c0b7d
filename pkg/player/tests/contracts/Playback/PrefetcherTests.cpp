// Repository: Vidmark-player
// Component: Prefetcher Contract Tests
// Purpose: Normal and urgent fills, sequential cursor, epoch invalidation
// Copyright (c) 2025 Vidmark

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "vidmark/playback/Prefetcher.hpp"
#include "vidmark/playback/SessionState.hpp"

#include "../../fixtures/FakeFrameSource.h"
#include "../../support/EventRecorder.hpp"

namespace vidmark::playback::testing {
namespace {

using test_infra::WaitFor;
using vidmark::tests::fixtures::FakeFrameSource;
using vidmark::tests::fixtures::FakeSourceControl;

std::shared_ptr<PlaybackCore> MakeLoadedCore(
    const std::shared_ptr<FakeSourceControl>& control,
    const EngineConfig& config = EngineConfig()) {
  auto core = std::make_shared<PlaybackCore>(config);
  auto source = std::make_unique<FakeFrameSource>(control);
  SourceInfo info;
  EXPECT_EQ(source->Open("fake.mp4", info), PlaybackError::kNone);
  core->source.source = std::move(source);

  std::lock_guard<std::mutex> lock(core->state.mutex);
  core->state.loaded = true;
  core->state.session = Session::FromSource("fake.mp4", info);
  return core;
}

std::vector<int64_t> BufferIndices(PlaybackCore& core) {
  std::lock_guard<std::mutex> lock(core.state.mutex);
  return core.state.buffer.Indices();
}

int BufferSize(PlaybackCore& core) {
  std::lock_guard<std::mutex> lock(core.state.mutex);
  return core.state.buffer.Size();
}

std::vector<int64_t> Range(int64_t first, int64_t count) {
  std::vector<int64_t> out;
  for (int64_t i = 0; i < count; ++i) out.push_back(first + i);
  return out;
}

// =============================================================================
// PF-001: DecodeAt maintains the sequential-read cursor
// =============================================================================
TEST(PrefetcherTest, DecodeAtSetsSequentialHintOnlyForNextIndex) {
  auto control = std::make_shared<FakeSourceControl>();
  auto core = MakeLoadedCore(control);

  FramePtr frame;
  ASSERT_EQ(Prefetcher::DecodeAt(*core, 0, frame), DecodeStatus::kOk);
  ASSERT_EQ(Prefetcher::DecodeAt(*core, 1, frame), DecodeStatus::kOk);
  ASSERT_EQ(Prefetcher::DecodeAt(*core, 2, frame), DecodeStatus::kOk);
  ASSERT_EQ(Prefetcher::DecodeAt(*core, 40, frame), DecodeStatus::kOk);

  EXPECT_EQ(control->seeking_decodes.load(), 2);  // 0 (no cursor) and 40
  EXPECT_EQ(control->hinted_decodes.load(), 2);   // 1 and 2
  ASSERT_NE(frame, nullptr);
  EXPECT_EQ(frame->data[0], 40);

  std::lock_guard<std::mutex> lock(core->state.mutex);
  EXPECT_EQ(core->state.last_sequential_index, 40);
  EXPECT_EQ(core->state.latency.Count(), 4u);
}

TEST(PrefetcherTest, DecodeAtFailureResetsCursor) {
  auto control = std::make_shared<FakeSourceControl>();
  control->fail_at_index = 2;
  auto core = MakeLoadedCore(control);

  FramePtr frame;
  ASSERT_EQ(Prefetcher::DecodeAt(*core, 1, frame), DecodeStatus::kOk);
  FramePtr failed;
  EXPECT_EQ(Prefetcher::DecodeAt(*core, 2, failed), DecodeStatus::kDecodeFailed);
  EXPECT_EQ(failed, nullptr);

  std::lock_guard<std::mutex> lock(core->state.mutex);
  EXPECT_EQ(core->state.last_sequential_index, -1);
  EXPECT_EQ(core->state.metrics.decode_failures, 1);
  EXPECT_EQ(core->state.latency.Count(), 1u);
}

TEST(PrefetcherTest, DecodeAtWithoutSourceFails) {
  auto core = std::make_shared<PlaybackCore>(EngineConfig());
  FramePtr frame;
  EXPECT_EQ(Prefetcher::DecodeAt(*core, 0, frame), DecodeStatus::kDecodeFailed);
}

// =============================================================================
// PF-002: Normal fill stop conditions
// =============================================================================
TEST(PrefetcherTest, NormalFillReachesDefaultTarget) {
  auto control = std::make_shared<FakeSourceControl>();
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  EXPECT_EQ(prefetcher.Prefetch(), 20);
  EXPECT_EQ(BufferIndices(*core), Range(0, 20));

  std::lock_guard<std::mutex> lock(core->state.mutex);
  EXPECT_TRUE(core->state.buffer.IsContiguous());
  EXPECT_EQ(core->state.metrics.normal_fills, 1);
  EXPECT_EQ(core->state.metrics.target_buffer_size, 20);
}

TEST(PrefetcherTest, NormalFillContinuesFromBufferTail) {
  auto control = std::make_shared<FakeSourceControl>();
  EngineConfig config;
  config.default_buffer_size = 6;
  auto core = MakeLoadedCore(control, config);
  Prefetcher prefetcher(core);

  ASSERT_EQ(prefetcher.Prefetch(), 6);

  // Consume three frames, as the loop would.
  {
    std::lock_guard<std::mutex> lock(core->state.mutex);
    BufferedFrame out;
    for (int64_t i = 0; i < 3; ++i) {
      ASSERT_TRUE(core->state.buffer.PopFor(i, out));
    }
    core->state.playback.next_frame_index = 3;
    core->state.latency.Clear();
  }

  EXPECT_EQ(prefetcher.Prefetch(), 3);
  EXPECT_EQ(BufferIndices(*core), Range(3, 6));
  // Reading on from the tail uses the cheap sequential path.
  EXPECT_EQ(control->seeking_decodes.load(), 1);
}

TEST(PrefetcherTest, NormalFillStopsAtEndOfStream) {
  auto control = std::make_shared<FakeSourceControl>();
  control->total_frames = 8;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  EXPECT_EQ(prefetcher.Prefetch(), 8);
  EXPECT_EQ(BufferIndices(*core), Range(0, 8));
  // No decode is attempted past the last frame.
  EXPECT_EQ(control->decodes.load(), 8);
}

TEST(PrefetcherTest, NormalFillStopsSilentlyAtDecodeFailure) {
  auto control = std::make_shared<FakeSourceControl>();
  control->fail_at_index = 4;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  EXPECT_EQ(prefetcher.Prefetch(), 4);
  EXPECT_EQ(BufferIndices(*core), Range(0, 4));
}

TEST(PrefetcherTest, NormalFillHonorsTimeBudget) {
  auto control = std::make_shared<FakeSourceControl>();
  control->decode_delay_ms = 30;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  auto t0 = std::chrono::steady_clock::now();
  int appended = prefetcher.Prefetch();
  auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_GE(appended, 1);
  EXPECT_LE(appended, 4);
  // Budget 100 ms plus at most one decode in flight when it expired.
  EXPECT_LT(elapsed, std::chrono::milliseconds(100 + 30 + 60));
}

TEST(PrefetcherTest, NormalFillDoesNothingWhenStopped) {
  auto control = std::make_shared<FakeSourceControl>();
  auto core = MakeLoadedCore(control);
  {
    std::lock_guard<std::mutex> lock(core->state.mutex);
    core->state.playback.is_stopped = true;
  }
  Prefetcher prefetcher(core);
  EXPECT_EQ(prefetcher.Prefetch(), 0);
  EXPECT_EQ(control->decodes.load(), 0);
}

// =============================================================================
// PF-003: Urgent burst
// =============================================================================
TEST(PrefetcherTest, UrgentBurstFillsFiveFrames) {
  auto control = std::make_shared<FakeSourceControl>();
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  EXPECT_EQ(prefetcher.Prefetch(PrefetchPriority::kUrgent), 5);
  ASSERT_TRUE(WaitFor([&] { return BufferSize(*core) >= 5; },
                      std::chrono::milliseconds(1000)));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(BufferIndices(*core), Range(0, 5));
}

TEST(PrefetcherTest, UrgentBurstSkippedWhenBufferNotLow) {
  auto control = std::make_shared<FakeSourceControl>();
  EngineConfig config;
  config.default_buffer_size = 5;
  auto core = MakeLoadedCore(control, config);
  Prefetcher prefetcher(core);
  ASSERT_EQ(prefetcher.Prefetch(), 5);

  EXPECT_EQ(prefetcher.Prefetch(PrefetchPriority::kUrgent), 0);
  std::lock_guard<std::mutex> lock(core->state.mutex);
  EXPECT_EQ(core->state.metrics.urgent_bursts, 0);
}

TEST(PrefetcherTest, UrgentBurstReturnsImmediately) {
  auto control = std::make_shared<FakeSourceControl>();
  control->decode_delay_ms = 50;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  auto t0 = std::chrono::steady_clock::now();
  prefetcher.Prefetch(PrefetchPriority::kUrgent);
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(40));

  ASSERT_TRUE(WaitFor([&] { return BufferSize(*core) >= 5; },
                      std::chrono::milliseconds(2000)));
}

TEST(PrefetcherTest, UrgentBurstDroppedAfterEpochChange) {
  auto control = std::make_shared<FakeSourceControl>();
  control->decode_delay_ms = 20;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  ASSERT_EQ(prefetcher.Prefetch(PrefetchPriority::kUrgent), 5);
  {
    // A seek lands while the first burst decode is in flight.
    std::lock_guard<std::mutex> lock(core->state.mutex);
    core->state.epoch++;
    core->state.buffer.Clear();
    core->state.playback.next_frame_index = 200;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(150));

  EXPECT_TRUE(BufferIndices(*core).empty());
  EXPECT_LE(control->decodes.load(), 1);
}

TEST(PrefetcherTest, UrgentBurstToleratesCoreTeardown) {
  auto control = std::make_shared<FakeSourceControl>();
  control->decode_delay_ms = 20;
  {
    auto core = MakeLoadedCore(control);
    Prefetcher prefetcher(core);
    ASSERT_EQ(prefetcher.Prefetch(PrefetchPriority::kUrgent), 5);
  }
  // The burst finishes its in-flight frame, then finds the core gone.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  const int settled = control->decodes.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(control->decodes.load(), settled);
  EXPECT_LE(settled, 2);
  EXPECT_FALSE(control->open_now.load());
}

TEST(PrefetcherTest, ConcurrentFillsSerializeSourceCalls) {
  auto control = std::make_shared<FakeSourceControl>();
  control->decode_delay_ms = 2;
  auto core = MakeLoadedCore(control);
  Prefetcher prefetcher(core);

  prefetcher.Prefetch(PrefetchPriority::kUrgent);
  std::thread normal([&] { prefetcher.Prefetch(); });
  normal.join();
  ASSERT_TRUE(WaitFor([&] { return BufferSize(*core) >= 5; },
                      std::chrono::milliseconds(1000)));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(control->max_in_flight.load(), 1);
  std::lock_guard<std::mutex> lock(core->state.mutex);
  EXPECT_TRUE(core->state.buffer.IsContiguous());
  EXPECT_EQ(core->state.buffer.FrontIndex().value(), 0);
}

}  // namespace
}  // namespace vidmark::playback::testing
