// Repository: Vidmark-player
// Component: Playback Clock
// Purpose: Speed-scaled frame pacing and the bounded frame-skip policy.
// Copyright (c) 2025 Vidmark
//
// PlaybackClock turns the nominal frame duration and a speed multiplier into
// the wall-clock interval between frame deliveries. It also remembers when
// the last delivered frame's slot began, so the loop can tell how far behind
// it has fallen and how many buffered frames to discard to catch up.
//
// Owned exclusively by the playback loop thread; no locking.

#ifndef VIDMARK_PLAYBACK_PLAYBACK_CLOCK_HPP_
#define VIDMARK_PLAYBACK_PLAYBACK_CLOCK_HPP_

#include <chrono>
#include <cstdint>

#include "vidmark/playback/EngineConfig.hpp"

namespace vidmark::playback {

class PlaybackClock {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  explicit PlaybackClock(const EngineConfig& config);

  // Nominal frame duration of the loaded session (1000 / fps).
  void SetFrameDurationMs(double frame_duration_ms);
  double FrameDurationMs() const { return frame_duration_ms_; }

  // target_frame_interval = frame_duration_ms / speed.
  double TargetIntervalMs(double speed) const;

  // Frames to discard when elapsed exceeds interval + skip threshold:
  //   floor((elapsed - interval) / interval), clamped to max_skip_frames.
  // Zero when skipping is disabled or the loop is on time.
  int FramesToSkip(double elapsed_ms, double interval_ms) const;

  // Remaining sleep after an iteration that took spent_ms:
  //   max(1ms, interval - spent). The 1ms floor yields instead of spinning.
  std::chrono::microseconds SleepDuration(double interval_ms,
                                          double spent_ms) const;

  // --- Slot anchor ---

  // Records the start of the iteration that delivered the latest frame.
  void MarkFrameSlot(TimePoint slot_start);

  // Forgets the anchor (play, seek, load). The next frame is never "late".
  void ResetAnchor();

  bool HasAnchor() const { return has_anchor_; }

  // Milliseconds since the anchored slot; 0 without an anchor.
  double ElapsedMs(TimePoint now) const;

 private:
  double frame_duration_ms_ = 0.0;
  double skip_threshold_ms_;
  int max_skip_frames_;
  bool skip_enabled_;

  TimePoint anchor_{};
  bool has_anchor_ = false;
};

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_PLAYBACK_CLOCK_HPP_
