// Repository: Vidmark-player
// Component: Prefetcher
// Purpose: Inline and burst fills of the lookahead FrameBuffer.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/Prefetcher.hpp"

#include <chrono>
#include <sstream>
#include <thread>
#include <utility>

#include "vidmark/util/Logger.hpp"

namespace vidmark::playback {

using vidmark::util::Logger;

Prefetcher::Prefetcher(std::shared_ptr<PlaybackCore> core)
    : core_(std::move(core)) {}

// =============================================================================
// DecodeAt: one serialized FrameSource call
// =============================================================================

DecodeStatus Prefetcher::DecodeAt(PlaybackCore& core, int64_t index,
                                  FramePtr& out) {
  std::lock_guard<std::mutex> source_lock(core.source.mutex);
  IFrameSource* source = core.source.source.get();
  if (!source || !source->IsOpen()) {
    return DecodeStatus::kDecodeFailed;
  }

  bool sequential_hint = false;
  {
    std::lock_guard<std::mutex> lock(core.state.mutex);
    sequential_hint = core.state.last_sequential_index >= 0 &&
                      index == core.state.last_sequential_index + 1;
  }

  auto frame = std::make_shared<VideoFrame>();
  auto t0 = std::chrono::steady_clock::now();
  DecodeStatus status = source->Decode(index, sequential_hint, *frame);
  double seconds = std::chrono::duration<double>(
      std::chrono::steady_clock::now() - t0).count();

  {
    std::lock_guard<std::mutex> lock(core.state.mutex);
    if (status == DecodeStatus::kOk) {
      // The source now sits right after index, whatever the playhead did
      // meanwhile, so the cursor follows the source.
      core.state.last_sequential_index = index;
      core.state.latency.Record(seconds);
    } else {
      core.state.last_sequential_index = -1;
      core.state.metrics.decode_failures++;
    }
  }

  if (status == DecodeStatus::kOk) {
    out = std::move(frame);
  }
  return status;
}

// =============================================================================
// Prefetch: entry point for both priorities
// =============================================================================

int Prefetcher::Prefetch(PrefetchPriority priority) {
  PlaybackCore& core = *core_;
  uint64_t epoch = 0;
  int limit = 0;

  if (priority == PrefetchPriority::kUrgent) {
    {
      std::lock_guard<std::mutex> lock(core.state.mutex);
      if (!core.state.loaded || core.state.playback.is_stopped) return 0;
      if (core.state.buffer.Size() >= core.config.urgent_threshold) return 0;
      epoch = core.state.epoch;
      core.state.metrics.urgent_bursts++;
    }
    const int frames = core.config.urgent_burst_frames;
    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[Prefetcher] URGENT_BURST epoch=" << epoch << " frames=" << frames;
      Logger::Debug(oss.str());
    }
    std::thread(&Prefetcher::BurstTask, std::weak_ptr<PlaybackCore>(core_),
                epoch, frames).detach();
    return frames;
  }

  {
    std::lock_guard<std::mutex> lock(core.state.mutex);
    if (!core.state.loaded || core.state.playback.is_stopped) return 0;
    epoch = core.state.epoch;
    limit = ComputeTargetSize(core.state.latency,
                              core.state.session.frame_duration_ms,
                              core.config);
    core.state.metrics.target_buffer_size = limit;
    core.state.metrics.normal_fills++;
  }
  return Fill(core, epoch, limit, limit, core.config.prefetch_budget_ms);
}

// =============================================================================
// Fill: decode next contiguous indices until a stop condition
// =============================================================================

int Prefetcher::Fill(PlaybackCore& core, uint64_t epoch, int max_attempts,
                     int limit_frames, int budget_ms) {
  const auto start = std::chrono::steady_clock::now();
  int appended = 0;
  const char* exit_reason = "attempts";

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    int64_t index = -1;
    {
      std::lock_guard<std::mutex> lock(core.state.mutex);
      SessionState& st = core.state;
      if (st.playback.is_stopped || !st.loaded || st.epoch != epoch) {
        exit_reason = "superseded";
        break;
      }
      if (st.buffer.Size() >= limit_frames) {
        exit_reason = "full";
        break;
      }
      index = st.buffer.NextContiguousIndex().value_or(
          st.playback.next_frame_index);
      if (index >= st.session.total_frames) {
        exit_reason = "end_of_stream";
        break;
      }
    }

    FramePtr frame;
    DecodeStatus status = DecodeAt(core, index, frame);
    if (status != DecodeStatus::kOk) {
      std::ostringstream oss;
      oss << "[Prefetcher] Fill stopped at index=" << index
          << " status=" << ToString(status);
      Logger::Warn(oss.str());
      exit_reason = "decode";
      break;
    }

    {
      std::lock_guard<std::mutex> lock(core.state.mutex);
      SessionState& st = core.state;
      if (st.playback.is_stopped || st.epoch != epoch) {
        exit_reason = "superseded";
        break;
      }
      // Behind the playhead (the loop decoded it directly) or raced by a
      // concurrent fill: drop it and recompute the next index.
      if (index >= st.playback.next_frame_index &&
          st.buffer.Append(BufferedFrame{std::move(frame), index})) {
        appended++;
        st.metrics.frames_prefetched++;
        st.metrics.buffer_depth = st.buffer.Size();
      }
    }

    if (budget_ms > 0) {
      auto elapsed = std::chrono::steady_clock::now() - start;
      if (elapsed >= std::chrono::milliseconds(budget_ms)) {
        exit_reason = "budget";
        break;
      }
    }
  }

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[Prefetcher] Fill done epoch=" << epoch << " appended=" << appended
        << " limit=" << limit_frames << " exit=" << exit_reason;
    Logger::Debug(oss.str());
  }
  return appended;
}

// =============================================================================
// BurstTask: detached; re-acquires the core per frame
// =============================================================================

void Prefetcher::BurstTask(std::weak_ptr<PlaybackCore> weak_core,
                           uint64_t epoch, int frames) {
  for (int i = 0; i < frames; ++i) {
    std::shared_ptr<PlaybackCore> core = weak_core.lock();
    if (!core) return;
    const int limit = core->config.max_buffer_size;
    if (Fill(*core, epoch, 1, limit, 0) == 0) return;
  }
}

}  // namespace vidmark::playback
