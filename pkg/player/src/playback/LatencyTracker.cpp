// Repository: Vidmark-player
// Component: LatencyTracker
// Purpose: Rolling window of per-frame decode durations.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/LatencyTracker.hpp"

#include <algorithm>

namespace vidmark::playback {

LatencyTracker::LatencyTracker(size_t capacity)
    : ring_(std::max<size_t>(capacity, 1), 0.0) {}

void LatencyTracker::Record(double duration_seconds) {
  ring_[pos_] = duration_seconds;
  pos_ = (pos_ + 1) % ring_.size();
  if (count_ < ring_.size()) {
    count_++;
  }
}

double LatencyTracker::Average() const {
  if (count_ == 0) return 0.0;
  // When not yet wrapped the samples occupy [0, count_); once wrapped the
  // whole ring is live. Either way the first count_ slots hold the window.
  double sum = 0.0;
  for (size_t i = 0; i < count_; ++i) {
    sum += ring_[i];
  }
  return sum / static_cast<double>(count_);
}

void LatencyTracker::Clear() {
  std::fill(ring_.begin(), ring_.end(), 0.0);
  pos_ = 0;
  count_ = 0;
}

}  // namespace vidmark::playback
