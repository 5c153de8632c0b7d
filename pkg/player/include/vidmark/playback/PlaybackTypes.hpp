// Repository: Vidmark-player
// Component: Playback Types
// Purpose: Frame, session and error types shared by the playback engine,
//          its frame sources and its callers.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_PLAYBACK_TYPES_HPP_
#define VIDMARK_PLAYBACK_PLAYBACK_TYPES_HPP_

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vidmark::playback {

// VideoFrame is a decoded, packed RGB24 image (3 bytes per pixel, row stride
// == width * 3). Immutable once handed to the engine: sources fill a frame,
// then the engine wraps it in a shared_ptr<const VideoFrame>.
struct VideoFrame {
  int width = 0;
  int height = 0;
  int64_t pts_us = 0;  // Source presentation time (informational)
  std::vector<uint8_t> data;

  bool Empty() const { return data.empty(); }
  size_t StrideBytes() const { return static_cast<size_t>(width) * 3; }
};

using FramePtr = std::shared_ptr<const VideoFrame>;

// BufferedFrame: a decoded frame tagged with its source frame index.
struct BufferedFrame {
  FramePtr frame;
  int64_t source_index = -1;
};

// Properties reported by a FrameSource on open.
struct SourceInfo {
  double frame_rate = 0.0;
  int64_t total_frames = 0;
  int width = 0;
  int height = 0;
};

// Session: immutable description of the loaded source (until the next load).
struct Session {
  std::string path;
  double frame_rate = 0.0;
  int64_t total_frames = 0;
  double frame_duration_ms = 0.0;  // 1000 / frame_rate
  int64_t total_duration_ms = 0;   // round(total_frames / frame_rate * 1000)

  static Session FromSource(const std::string& path, const SourceInfo& info) {
    Session s;
    s.path = path;
    s.frame_rate = info.frame_rate;
    s.total_frames = info.total_frames;
    s.frame_duration_ms = 1000.0 / info.frame_rate;
    s.total_duration_ms = static_cast<int64_t>(std::llround(
        static_cast<double>(info.total_frames) / info.frame_rate * 1000.0));
    return s;
  }
};

// Engine error taxonomy. kNone means success.
enum class PlaybackError {
  kNone = 0,
  kSourceNotFound,
  kSourceUnreadable,
  kDecodeFailed,
  kEndOfStream,
  kInvalidSeekTarget,
  kNoSource,  // Command issued before a successful load, or after stop.
};

// Result of a single FrameSource decode call.
enum class DecodeStatus {
  kOk,
  kDecodeFailed,
  kEndOfStream,
};

inline const char* ToString(PlaybackError error) {
  switch (error) {
    case PlaybackError::kNone: return "OK";
    case PlaybackError::kSourceNotFound: return "SOURCE_NOT_FOUND";
    case PlaybackError::kSourceUnreadable: return "SOURCE_UNREADABLE";
    case PlaybackError::kDecodeFailed: return "DECODE_FAILED";
    case PlaybackError::kEndOfStream: return "END_OF_STREAM";
    case PlaybackError::kInvalidSeekTarget: return "INVALID_SEEK_TARGET";
    case PlaybackError::kNoSource: return "NO_SOURCE";
  }
  return "UNKNOWN";
}

inline const char* ToString(DecodeStatus status) {
  switch (status) {
    case DecodeStatus::kOk: return "OK";
    case DecodeStatus::kDecodeFailed: return "DECODE_FAILED";
    case DecodeStatus::kEndOfStream: return "END_OF_STREAM";
  }
  return "UNKNOWN";
}

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_PLAYBACK_TYPES_HPP_
