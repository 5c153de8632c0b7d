// Repository: Vidmark-player
// Component: PlaybackEngine
// Purpose: Background frame delivery for the review tool: decode ahead,
//          pace to a variable speed, react to seeks, skip when behind.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_PLAYBACK_ENGINE_HPP_
#define VIDMARK_PLAYBACK_PLAYBACK_ENGINE_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/IFrameSource.hpp"
#include "vidmark/playback/PlaybackTypes.hpp"
#include "vidmark/playback/Prefetcher.hpp"
#include "vidmark/playback/SessionState.hpp"

namespace vidmark::playback {

// PlaybackEngine owns one long-lived playback loop thread plus the shared
// session state. Commands may be issued from any thread (typically the UI
// thread); events are pushed through Callbacks.
//
// States: Paused (initial) ⇄ Playing, and Stopped (terminal for a session).
//
// Lifecycle:
//   1. Construct with a FrameSourceFactory and callbacks
//   2. Load(path): opens the source, emits on_duration_changed, starts the
//      loop thread if none is running, kicks an urgent prefetch
//   3. Play / Pause / Seek / SetSpeed / StepForward / StepBackward
//   4. Stop(): joins the loop thread and closes the source; a later Load()
//      starts a fresh session
//
// Callback threads:
//   on_duration_changed:  the thread calling Load()
//   on_frame_ready:       the loop thread while playing; the calling thread
//                         for paused Seek() and stepping
//   on_playback_finished: the loop thread
// Callbacks run with no engine lock held and may call Play/Pause/Seek/
// SetSpeed/Stop/Load. Stop() from a loop-thread callback closes the source
// before returning but cannot join its own thread: the loop exits once the
// callback returns, emitting nothing further, and the next Load() or Stop()
// (or the destructor) joins it.
class PlaybackEngine {
 public:
  struct Callbacks {
    std::function<void(int64_t total_duration_ms)> on_duration_changed;
    std::function<void(const FramePtr& frame, int64_t position_ms)> on_frame_ready;
    std::function<void()> on_playback_finished;
  };

  PlaybackEngine(FrameSourceFactory source_factory, Callbacks callbacks,
                 const EngineConfig& config = EngineConfig());
  ~PlaybackEngine();

  PlaybackEngine(const PlaybackEngine&) = delete;
  PlaybackEngine& operator=(const PlaybackEngine&) = delete;

  // --- Commands ---

  // Opens path and resets the session. On failure nothing about the engine
  // changes: kSourceNotFound for a path that is not a readable file,
  // otherwise the FrameSource's open error.
  PlaybackError Load(const std::string& path);

  // Idempotent.
  void Play();
  void Pause();

  // Blocks until the loop thread has exited and the source is closed.
  void Stop();

  // Clamps to [0, total_frames - 1] after rounding position_ms to a frame.
  // While paused, decodes and emits the target frame before returning.
  // Negative or NaN targets are rejected with kInvalidSeekTarget.
  PlaybackError Seek(double position_ms);

  // Clamps to [min_speed, max_speed] and returns the stored value.
  double SetSpeed(double speed);

  // Only while paused. Returns true when a frame was emitted.
  bool StepForward();
  bool StepBackward();

  // current_frame_index * frame_duration_ms, rounded. 0 before any load.
  int64_t CurrentPositionMs() const;

  // --- Observability ---

  bool IsLoaded() const;
  bool IsPaused() const;
  bool IsStopped() const;
  bool IsLoopRunning() const;
  double Speed() const;
  int64_t CurrentFrameIndex() const;
  Session GetSession() const;
  std::vector<int64_t> BufferedIndices() const;
  EngineMetrics GetMetrics() const;
  const EngineConfig& Config() const { return core_->config; }

 private:
  void PlaybackLoop();
  void EmitFrame(const FramePtr& frame, int64_t position_ms);
  void EmitFinished();
  PlaybackError SwapInSource(const std::string& path, Session& session);
  bool StepTo(int64_t delta);
  void CloseSource();

  std::shared_ptr<PlaybackCore> core_;
  Prefetcher prefetcher_;
  FrameSourceFactory source_factory_;
  Callbacks callbacks_;

  // Serializes Load/Stop: loop thread start and join never overlap.
  mutable std::mutex lifecycle_mutex_;
  std::thread loop_thread_;
};

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_PLAYBACK_ENGINE_HPP_
