// Repository: Vidmark-player
// Component: FrameBuffer
// Purpose: Bounded, index-contiguous lookahead of decoded frames ready for
//          display.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_FRAME_BUFFER_HPP_
#define VIDMARK_PLAYBACK_FRAME_BUFFER_HPP_

#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/LatencyTracker.hpp"
#include "vidmark/playback/PlaybackTypes.hpp"

namespace vidmark::playback {

// FrameBuffer holds decoded frames in ascending source_index order.
//
// Invariant: indices are contiguous and strictly increasing by 1. Append()
// rejects anything that would break this, and anything past the hard cap.
// The buffer is never partially trusted across a seek; callers Clear() it.
//
// Not thread-safe: owned by SessionState and touched only under its lock.
class FrameBuffer {
 public:
  explicit FrameBuffer(int hard_cap_frames = 30);

  // Appends frame if it extends the contiguous run (or the buffer is empty)
  // and the hard cap is not reached. Returns false when rejected.
  bool Append(BufferedFrame frame);

  // Pops the frame for expected_index.
  // Frames below expected_index are stale (e.g. after a step) and are
  // discarded first. If the front is then beyond expected_index the buffer
  // no longer describes "next" and is cleared. Returns false when no frame
  // for expected_index is available.
  bool PopFor(int64_t expected_index, BufferedFrame& out);

  // Index the next Append() must carry, or nullopt when empty.
  std::optional<int64_t> NextContiguousIndex() const;

  std::optional<int64_t> FrontIndex() const;
  std::optional<int64_t> BackIndex() const;

  int Size() const { return static_cast<int>(frames_.size()); }
  bool Empty() const { return frames_.empty(); }
  int HardCapFrames() const { return hard_cap_frames_; }

  void Clear();

  // Snapshot of the buffered indices, front first (diagnostics and tests).
  std::vector<int64_t> Indices() const;

  // True when indices are strictly increasing by 1.
  bool IsContiguous() const;

 private:
  int hard_cap_frames_;
  std::deque<BufferedFrame> frames_;
};

// Adaptive lookahead target:
//   clamp(avg_decode_s / (frame_duration_ms / 1000) * 2, min, max)
// or config.default_buffer_size when no latency sample exists yet.
int ComputeTargetSize(const LatencyTracker& latency, double frame_duration_ms,
                      const EngineConfig& config);

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_FRAME_BUFFER_HPP_
