// Repository: Vidmark-player
// Component: FrameBuffer
// Purpose: Bounded, index-contiguous lookahead of decoded frames.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/FrameBuffer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace vidmark::playback {

FrameBuffer::FrameBuffer(int hard_cap_frames)
    : hard_cap_frames_(std::max(1, hard_cap_frames)) {}

bool FrameBuffer::Append(BufferedFrame frame) {
  if (!frame.frame || frame.source_index < 0) return false;
  if (static_cast<int>(frames_.size()) >= hard_cap_frames_) return false;
  if (!frames_.empty() &&
      frame.source_index != frames_.back().source_index + 1) {
    return false;
  }
  frames_.push_back(std::move(frame));
  return true;
}

bool FrameBuffer::PopFor(int64_t expected_index, BufferedFrame& out) {
  while (!frames_.empty() && frames_.front().source_index < expected_index) {
    frames_.pop_front();
  }
  if (frames_.empty()) return false;
  if (frames_.front().source_index != expected_index) {
    frames_.clear();
    return false;
  }
  out = std::move(frames_.front());
  frames_.pop_front();
  return true;
}

std::optional<int64_t> FrameBuffer::NextContiguousIndex() const {
  if (frames_.empty()) return std::nullopt;
  return frames_.back().source_index + 1;
}

std::optional<int64_t> FrameBuffer::FrontIndex() const {
  if (frames_.empty()) return std::nullopt;
  return frames_.front().source_index;
}

std::optional<int64_t> FrameBuffer::BackIndex() const {
  if (frames_.empty()) return std::nullopt;
  return frames_.back().source_index;
}

void FrameBuffer::Clear() {
  frames_.clear();
}

std::vector<int64_t> FrameBuffer::Indices() const {
  std::vector<int64_t> out;
  out.reserve(frames_.size());
  for (const auto& f : frames_) {
    out.push_back(f.source_index);
  }
  return out;
}

bool FrameBuffer::IsContiguous() const {
  for (size_t i = 1; i < frames_.size(); ++i) {
    if (frames_[i].source_index != frames_[i - 1].source_index + 1) {
      return false;
    }
  }
  return true;
}

int ComputeTargetSize(const LatencyTracker& latency, double frame_duration_ms,
                      const EngineConfig& config) {
  if (latency.Empty() || frame_duration_ms <= 0.0) {
    return config.default_buffer_size;
  }
  const double frame_seconds = frame_duration_ms / 1000.0;
  const double wanted = latency.Average() / frame_seconds * 2.0;
  const int target = static_cast<int>(std::ceil(std::min(wanted, 1.0e6)));
  return std::clamp(target, config.min_buffer_size, config.max_buffer_size);
}

}  // namespace vidmark::playback
