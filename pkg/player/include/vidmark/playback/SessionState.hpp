// Repository: Vidmark-player
// Component: Session State
// Purpose: The single lock-guarded unit shared by the playback loop, the
//          prefetch tasks and command-issuing threads.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_SESSION_STATE_HPP_
#define VIDMARK_PLAYBACK_SESSION_STATE_HPP_

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/FrameBuffer.hpp"
#include "vidmark/playback/IFrameSource.hpp"
#include "vidmark/playback/LatencyTracker.hpp"
#include "vidmark/playback/PlaybackTypes.hpp"

namespace vidmark::playback {

struct PlaybackState {
  // Playhead: the frame most recently presented (or about to be, right
  // after load). current_position_ms() derives from this.
  int64_t current_frame_index = 0;
  // Frame the loop presents next while playing.
  int64_t next_frame_index = 0;
  bool is_paused = true;
  bool is_stopped = false;
  double speed = 1.0;
};

// Counters, all under SessionState::mutex.
struct EngineMetrics {
  int64_t frames_emitted = 0;
  int64_t frames_skipped = 0;
  int64_t skip_events = 0;
  int64_t max_skip_in_event = 0;
  int64_t direct_decodes = 0;
  int64_t decode_failures = 0;
  int64_t normal_fills = 0;
  int64_t urgent_bursts = 0;
  int64_t frames_prefetched = 0;
  int buffer_depth = 0;
  int target_buffer_size = 0;
};

// SessionState: {Session, PlaybackState, FrameBuffer, SequentialReadCursor}
// as one unit behind one mutex. Every read or write of these fields happens
// with `mutex` held, and never across a FrameSource call.
//
// `cv` parks the playback loop while paused; play/pause/seek/stop notify it.
//
// `epoch` is bumped by every load, seek and stop. A decode started under an
// older epoch must not touch the buffer or the playhead when it completes.
struct SessionState {
  explicit SessionState(const EngineConfig& config)
      : buffer(config.max_buffer_size),
        latency(static_cast<size_t>(config.latency_window)) {}

  std::mutex mutex;
  std::condition_variable cv;

  bool loaded = false;
  Session session;
  PlaybackState playback;
  FrameBuffer buffer;
  LatencyTracker latency;
  int64_t last_sequential_index = -1;
  uint64_t epoch = 0;
  EngineMetrics metrics;
};

// The FrameSource and the lock serializing calls into it.
// Lock order: source mutex first, then SessionState::mutex. Never the reverse.
struct SourceSlot {
  std::mutex mutex;
  std::unique_ptr<IFrameSource> source;
};

// Everything the loop, the prefetchers and the commands share. The engine
// owns it through a shared_ptr; detached prefetch bursts hold only a
// weak_ptr, so a torn-down engine is never reached through them.
struct PlaybackCore {
  explicit PlaybackCore(const EngineConfig& cfg) : config(cfg), state(cfg) {}

  const EngineConfig config;
  SessionState state;
  SourceSlot source;
};

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_SESSION_STATE_HPP_
