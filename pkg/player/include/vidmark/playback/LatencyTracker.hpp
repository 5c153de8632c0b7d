// Repository: Vidmark-player
// Component: LatencyTracker
// Purpose: Rolling window of per-frame decode durations for adaptive
//          lookahead sizing.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_LATENCY_TRACKER_HPP_
#define VIDMARK_PLAYBACK_LATENCY_TRACKER_HPP_

#include <cstddef>
#include <vector>

namespace vidmark::playback {

// Fixed-capacity ring of the most recent decode durations (seconds).
// Recording past capacity evicts the oldest sample.
//
// Not thread-safe: owned by SessionState and touched only under its lock.
class LatencyTracker {
 public:
  static constexpr size_t kDefaultCapacity = 10;

  explicit LatencyTracker(size_t capacity = kDefaultCapacity);

  void Record(double duration_seconds);

  // Mean of the current samples; 0.0 when empty.
  double Average() const;

  size_t Count() const { return count_; }
  size_t Capacity() const { return ring_.size(); }
  bool Empty() const { return count_ == 0; }

  void Clear();

 private:
  std::vector<double> ring_;
  size_t pos_ = 0;
  size_t count_ = 0;
};

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_LATENCY_TRACKER_HPP_
