// Repository: Vidmark-player
// Component: Prefetcher
// Purpose: Fills the FrameBuffer from the FrameSource: time-budgeted inline
//          fills for steady playback, detached bursts after load/seek.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_PREFETCHER_HPP_
#define VIDMARK_PLAYBACK_PREFETCHER_HPP_

#include <cstdint>
#include <memory>

#include "vidmark/playback/PlaybackTypes.hpp"
#include "vidmark/playback/SessionState.hpp"

namespace vidmark::playback {

enum class PrefetchPriority {
  kNormal,  // Inline, bounded by target size and prefetch_budget_ms
  kUrgent,  // Detached burst of urgent_burst_frames, only when depth is low
};

// Prefetcher decodes the next contiguous indices and appends them to the
// session buffer.
//
// Normal fill runs on the caller's thread (the playback loop) and stops at
// the adaptive target size, end of stream, the first decode failure, or the
// wall-clock budget, whichever comes first.
//
// Urgent fill launches a detached thread and returns immediately. The thread
// holds a weak_ptr to the PlaybackCore and re-acquires it per frame; it is
// never joined. Its appends are dropped once the session epoch moves on
// (seek, load, stop), so a stale burst can never corrupt a newer buffer.
//
// Decode failures end the fill attempt silently; a gap surfaces later as
// end-of-stream when the loop reaches it.
class Prefetcher {
 public:
  explicit Prefetcher(std::shared_ptr<PlaybackCore> core);

  // Normal: returns frames appended. Urgent: returns frames scheduled
  // (0 when no burst was launched).
  int Prefetch(PrefetchPriority priority = PrefetchPriority::kNormal);

  // Decodes index through the source lock, maintaining the sequential-read
  // cursor and the latency window. Shared by fills and the engine's direct
  // decodes (fallback playback, paused seek, stepping).
  static DecodeStatus DecodeAt(PlaybackCore& core, int64_t index,
                               FramePtr& out);

 private:
  // Attempts up to max_attempts decodes for epoch, appending while depth
  // stays below limit_frames. budget_ms <= 0 disables the time budget.
  static int Fill(PlaybackCore& core, uint64_t epoch, int max_attempts,
                  int limit_frames, int budget_ms);

  static void BurstTask(std::weak_ptr<PlaybackCore> weak_core, uint64_t epoch,
                        int frames);

  std::shared_ptr<PlaybackCore> core_;
};

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_PREFETCHER_HPP_
