// Repository: Vidmark-player
// Component: IFrameSource
// Purpose: Minimal decoder surface used by the playback engine so tests can
//          inject a fake source. Production uses FFmpegFrameSource; tests use
//          FakeFrameSource.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_IFRAME_SOURCE_HPP_
#define VIDMARK_PLAYBACK_IFRAME_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "vidmark/playback/PlaybackTypes.hpp"

namespace vidmark::playback {

// Synchronous, possibly slow frame decoder over one media file.
//
// Thread safety: none. The engine serializes every call behind its source
// lock, so implementations may assume a single caller at a time.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Opens the media at path. On success fills info and returns kNone;
  // otherwise kSourceNotFound or kSourceUnreadable.
  virtual PlaybackError Open(const std::string& path, SourceInfo& info) = 0;

  // Decodes the frame at index into out.
  // sequential_hint: caller asserts index immediately follows the previous
  // successful decode, so the source may read-next instead of seeking.
  virtual DecodeStatus Decode(int64_t index, bool sequential_hint,
                              VideoFrame& out) = 0;

  // Releases all decoder resources. Idempotent.
  virtual void Close() = 0;

  virtual bool IsOpen() const = 0;
};

// Creates a fresh, unopened source for each load().
using FrameSourceFactory = std::function<std::unique_ptr<IFrameSource>()>;

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_IFRAME_SOURCE_HPP_
