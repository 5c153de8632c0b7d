// Repository: Vidmark-player
// Component: Playback Clock
// Purpose: Speed-scaled frame pacing and the bounded frame-skip policy.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/PlaybackClock.hpp"

#include <cmath>

namespace vidmark::playback {

static constexpr int64_t kMinSleepUs = 1000;

PlaybackClock::PlaybackClock(const EngineConfig& config)
    : skip_threshold_ms_(config.skip_threshold_ms),
      max_skip_frames_(config.max_skip_frames),
      skip_enabled_(config.frame_skip_enabled) {}

void PlaybackClock::SetFrameDurationMs(double frame_duration_ms) {
  frame_duration_ms_ = frame_duration_ms;
}

double PlaybackClock::TargetIntervalMs(double speed) const {
  if (speed <= 0.0) return frame_duration_ms_;
  return frame_duration_ms_ / speed;
}

int PlaybackClock::FramesToSkip(double elapsed_ms, double interval_ms) const {
  if (!skip_enabled_ || interval_ms <= 0.0) return 0;
  if (!(elapsed_ms > interval_ms + skip_threshold_ms_)) return 0;

  const double behind = std::floor((elapsed_ms - interval_ms) / interval_ms);
  if (behind <= 0.0) return 0;
  if (behind >= static_cast<double>(max_skip_frames_)) return max_skip_frames_;
  return static_cast<int>(behind);
}

std::chrono::microseconds PlaybackClock::SleepDuration(double interval_ms,
                                                       double spent_ms) const {
  const double remaining_us = (interval_ms - spent_ms) * 1000.0;
  const int64_t us = remaining_us > static_cast<double>(kMinSleepUs)
      ? static_cast<int64_t>(remaining_us)
      : kMinSleepUs;
  return std::chrono::microseconds(us);
}

void PlaybackClock::MarkFrameSlot(TimePoint slot_start) {
  anchor_ = slot_start;
  has_anchor_ = true;
}

void PlaybackClock::ResetAnchor() {
  has_anchor_ = false;
}

double PlaybackClock::ElapsedMs(TimePoint now) const {
  if (!has_anchor_) return 0.0;
  return std::chrono::duration<double, std::milli>(now - anchor_).count();
}

}  // namespace vidmark::playback
