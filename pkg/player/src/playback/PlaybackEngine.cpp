// Repository: Vidmark-player
// Component: PlaybackEngine
// Purpose: Playback loop thread plus the thread-safe command surface.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/PlaybackEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "vidmark/playback/PlaybackClock.hpp"
#include "vidmark/util/Logger.hpp"

namespace vidmark::playback {

using vidmark::util::Logger;

namespace {

// A path is loadable when it names an existing regular file we can open.
bool IsReadableFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
  std::ifstream probe(path, std::ios::binary);
  return probe.good();
}

int64_t PositionMs(int64_t index, double frame_duration_ms) {
  return static_cast<int64_t>(
      std::llround(static_cast<double>(index) * frame_duration_ms));
}

}  // namespace

PlaybackEngine::PlaybackEngine(FrameSourceFactory source_factory,
                               Callbacks callbacks, const EngineConfig& config)
    : core_(std::make_shared<PlaybackCore>(Normalize(config))),
      prefetcher_(core_),
      source_factory_(std::move(source_factory)),
      callbacks_(std::move(callbacks)) {}

PlaybackEngine::~PlaybackEngine() {
  Stop();
}

// =============================================================================
// Load
// =============================================================================

PlaybackError PlaybackEngine::Load(const std::string& path) {
  Session session;
  {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    PlaybackError err = SwapInSource(path, session);
    if (err != PlaybackError::kNone) return err;

    if (!loop_thread_.joinable()) {
      loop_thread_ = std::thread(&PlaybackEngine::PlaybackLoop, this);
    }
  }

  std::ostringstream oss;
  oss << "[PlaybackEngine] LOAD_OK path=" << path
      << " frames=" << session.total_frames << " fps=" << session.frame_rate
      << " duration_ms=" << session.total_duration_ms;
  Logger::Info(oss.str());

  // Lifecycle lock released: the callback may issue any command.
  if (callbacks_.on_duration_changed) {
    callbacks_.on_duration_changed(session.total_duration_ms);
  }
  prefetcher_.Prefetch(PrefetchPriority::kUrgent);
  return PlaybackError::kNone;
}

// Opens path and installs it as the current session. Caller holds
// lifecycle_mutex_. A failure leaves every piece of engine state untouched.
PlaybackError PlaybackEngine::SwapInSource(const std::string& path,
                                           Session& session) {
  if (!IsReadableFile(path)) {
    Logger::Error("[PlaybackEngine] LOAD_FAILED path=" + path +
                  " error=" + ToString(PlaybackError::kSourceNotFound));
    return PlaybackError::kSourceNotFound;
  }

  std::unique_ptr<IFrameSource> source =
      source_factory_ ? source_factory_() : nullptr;
  if (!source) {
    Logger::Error("[PlaybackEngine] LOAD_FAILED path=" + path +
                  " error=no frame source available");
    return PlaybackError::kSourceUnreadable;
  }

  SourceInfo info;
  PlaybackError err = source->Open(path, info);
  if (err == PlaybackError::kNone &&
      (!(info.frame_rate > 0.0) || info.total_frames < 0)) {
    source->Close();
    err = PlaybackError::kSourceUnreadable;
  }
  if (err != PlaybackError::kNone) {
    Logger::Error("[PlaybackEngine] LOAD_FAILED path=" + path +
                  " error=" + ToString(err));
    return err;
  }

  // A loop thread left behind by a Stop() issued from a callback is exiting;
  // it must be gone before is_stopped is cleared.
  if (loop_thread_.joinable() && IsStopped() &&
      loop_thread_.get_id() != std::this_thread::get_id()) {
    loop_thread_.join();
  }

  session = Session::FromSource(path, info);
  std::unique_ptr<IFrameSource> previous;
  {
    // Waits out any decode still running against the previous source.
    std::lock_guard<std::mutex> source_lock(core_->source.mutex);
    previous = std::move(core_->source.source);
    core_->source.source = std::move(source);

    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    st.epoch++;
    st.loaded = true;
    st.session = session;
    st.playback.current_frame_index = 0;
    st.playback.next_frame_index = 0;
    st.playback.is_paused = true;
    st.playback.is_stopped = false;
    st.buffer.Clear();
    st.latency.Clear();
    st.last_sequential_index = -1;
    st.metrics = EngineMetrics{};
  }
  core_->state.cv.notify_all();
  if (previous) previous->Close();
  return PlaybackError::kNone;
}

// =============================================================================
// Play / Pause / Stop
// =============================================================================

void PlaybackEngine::Play() {
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    if (!st.loaded || st.playback.is_stopped || !st.playback.is_paused) return;
    st.playback.is_paused = false;
  }
  core_->state.cv.notify_all();
  Logger::Info("[PlaybackEngine] PLAY");
}

void PlaybackEngine::Pause() {
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    if (st.playback.is_stopped || st.playback.is_paused) return;
    st.playback.is_paused = true;
  }
  core_->state.cv.notify_all();
  Logger::Info("[PlaybackEngine] PAUSE");
}

void PlaybackEngine::Stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  bool was_running = false;
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    was_running = st.loaded && !st.playback.is_stopped;
    st.playback.is_stopped = true;
    st.playback.is_paused = true;
    st.epoch++;
    st.buffer.Clear();
    st.metrics.buffer_depth = 0;
  }
  core_->state.cv.notify_all();

  if (loop_thread_.joinable()) {
    if (loop_thread_.get_id() == std::this_thread::get_id()) {
      // Called from a callback on the loop thread, which holds no engine
      // lock here. The loop sees is_stopped when the callback returns; the
      // next Load() or Stop() joins it.
      Logger::Warn("[PlaybackEngine] STOP from loop thread, join deferred");
      CloseSource();
      if (was_running) Logger::Info("[PlaybackEngine] STOPPED");
      return;
    }
    loop_thread_.join();
  }
  CloseSource();

  if (was_running) Logger::Info("[PlaybackEngine] STOPPED");
}

void PlaybackEngine::CloseSource() {
  std::unique_ptr<IFrameSource> source;
  {
    std::lock_guard<std::mutex> source_lock(core_->source.mutex);
    source = std::move(core_->source.source);
    if (source) source->Close();
  }
}

// =============================================================================
// Seek / Speed / Step
// =============================================================================

PlaybackError PlaybackEngine::Seek(double position_ms) {
  if (std::isnan(position_ms) || position_ms < 0.0) {
    std::ostringstream oss;
    oss << "[PlaybackEngine] SEEK rejected position_ms=" << position_ms;
    Logger::Warn(oss.str());
    return PlaybackError::kInvalidSeekTarget;
  }

  int64_t index = 0;
  uint64_t epoch = 0;
  bool paused = false;
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    if (!st.loaded || st.playback.is_stopped) return PlaybackError::kNoSource;
    if (st.session.total_frames <= 0) return PlaybackError::kEndOfStream;

    const double raw = std::round(position_ms / st.session.frame_duration_ms);
    const double last = static_cast<double>(st.session.total_frames - 1);
    index = static_cast<int64_t>(std::min(raw, last));
    st.playback.current_frame_index = index;
    st.playback.next_frame_index = index;
    st.buffer.Clear();
    st.metrics.buffer_depth = 0;
    st.last_sequential_index = -1;
    epoch = ++st.epoch;
    paused = st.playback.is_paused;
  }
  core_->state.cv.notify_all();

  std::ostringstream oss;
  oss << "[PlaybackEngine] SEEK position_ms=" << position_ms
      << " index=" << index << (paused ? " paused" : " playing");
  Logger::Info(oss.str());

  if (paused) {
    FramePtr frame;
    DecodeStatus status = Prefetcher::DecodeAt(*core_, index, frame);
    if (status == DecodeStatus::kOk) {
      bool emit = false;
      int64_t position = 0;
      {
        std::lock_guard<std::mutex> lock(core_->state.mutex);
        SessionState& st = core_->state;
        // Once Play() has taken over, the loop emits index itself.
        if (st.epoch == epoch && !st.playback.is_stopped &&
            st.playback.is_paused && st.playback.next_frame_index == index) {
          // Displayed frame is index; playing resumes after it.
          st.playback.next_frame_index = index + 1;
          position = PositionMs(index, st.session.frame_duration_ms);
          emit = true;
        }
      }
      if (emit) EmitFrame(frame, position);
    } else {
      std::ostringstream woss;
      woss << "[PlaybackEngine] SEEK decode failed index=" << index
           << " status=" << ToString(status);
      Logger::Warn(woss.str());
    }
  }

  prefetcher_.Prefetch(PrefetchPriority::kUrgent);
  return PlaybackError::kNone;
}

double PlaybackEngine::SetSpeed(double speed) {
  const EngineConfig& cfg = core_->config;
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  if (!std::isnan(speed)) {
    core_->state.playback.speed = std::clamp(speed, cfg.min_speed, cfg.max_speed);
  }
  return core_->state.playback.speed;
}

bool PlaybackEngine::StepForward() {
  return StepTo(1);
}

bool PlaybackEngine::StepBackward() {
  return StepTo(-1);
}

bool PlaybackEngine::StepTo(int64_t delta) {
  int64_t index = 0;
  uint64_t epoch = 0;
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    if (!st.loaded || st.playback.is_stopped || !st.playback.is_paused) {
      return false;
    }
    index = st.playback.current_frame_index + delta;
    if (index < 0 || index >= st.session.total_frames) return false;
    epoch = st.epoch;
  }

  FramePtr frame;
  DecodeStatus status = Prefetcher::DecodeAt(*core_, index, frame);
  if (status != DecodeStatus::kOk) {
    std::ostringstream oss;
    oss << "[PlaybackEngine] STEP decode failed index=" << index
        << " status=" << ToString(status);
    Logger::Warn(oss.str());
    return false;
  }

  int64_t position = 0;
  {
    std::lock_guard<std::mutex> lock(core_->state.mutex);
    SessionState& st = core_->state;
    if (st.epoch != epoch || st.playback.is_stopped || !st.playback.is_paused) {
      return false;
    }
    st.playback.current_frame_index = index;
    st.playback.next_frame_index = index + 1;
    position = PositionMs(index, st.session.frame_duration_ms);
  }
  EmitFrame(frame, position);
  return true;
}

// =============================================================================
// Playback loop
// =============================================================================

void PlaybackEngine::PlaybackLoop() {
  PlaybackCore& core = *core_;
  SessionState& st = core.state;
  PlaybackClock clock(core.config);
  uint64_t seen_epoch = 0;
  bool have_epoch = false;

  Logger::Info("[PlaybackEngine] LOOP_START");

  std::unique_lock<std::mutex> lock(st.mutex);
  while (!st.playback.is_stopped) {
    if (st.playback.is_paused) {
      st.cv.wait(lock, [&st] {
        return st.playback.is_stopped || !st.playback.is_paused;
      });
      // Time spent parked must not read as lag.
      clock.ResetAnchor();
      continue;
    }
    if (!have_epoch || st.epoch != seen_epoch) {
      seen_epoch = st.epoch;
      have_epoch = true;
      clock.ResetAnchor();
    }

    const auto slot_start = std::chrono::steady_clock::now();
    const uint64_t epoch = st.epoch;
    const int64_t total = st.session.total_frames;
    const double frame_duration_ms = st.session.frame_duration_ms;
    clock.SetFrameDurationMs(frame_duration_ms);
    const double interval_ms = clock.TargetIntervalMs(st.playback.speed);

    // Skip policy: drop buffered frames we are late for, never the last one.
    const int behind = clock.FramesToSkip(clock.ElapsedMs(slot_start), interval_ms);
    if (behind > 0) {
      int skipped = 0;
      BufferedFrame dropped;
      while (skipped < behind && st.playback.next_frame_index < total - 1 &&
             st.buffer.PopFor(st.playback.next_frame_index, dropped)) {
        st.playback.current_frame_index = st.playback.next_frame_index;
        st.playback.next_frame_index++;
        skipped++;
      }
      if (skipped > 0) {
        st.metrics.frames_skipped += skipped;
        st.metrics.skip_events++;
        st.metrics.max_skip_in_event =
            std::max<int64_t>(st.metrics.max_skip_in_event, skipped);
        std::ostringstream oss;
        oss << "[PlaybackEngine] SKIP frames=" << skipped
            << " behind=" << behind
            << " resume_index=" << st.playback.next_frame_index;
        Logger::Info(oss.str());
      }
    }

    const int64_t index = st.playback.next_frame_index;
    if (index >= total) {
      st.playback.is_paused = true;
      lock.unlock();
      EmitFinished();
      lock.lock();
      continue;
    }

    FramePtr frame;
    BufferedFrame buffered;
    if (st.buffer.PopFor(index, buffered)) {
      frame = std::move(buffered.frame);
    } else {
      st.metrics.direct_decodes++;
      lock.unlock();
      DecodeStatus status = Prefetcher::DecodeAt(core, index, frame);
      lock.lock();
      if (st.playback.is_stopped) break;
      if (st.epoch != epoch) continue;  // Seek or load while decoding.
      // A paused Seek() finishing while we waited for the source already
      // emitted index and moved the playhead past it.
      if (st.playback.next_frame_index != index) continue;
      if (status != DecodeStatus::kOk) {
        std::ostringstream oss;
        oss << "[PlaybackEngine] DECODE_FAILED index=" << index
            << " status=" << ToString(status) << ", treating as end of stream";
        Logger::Warn(oss.str());
        st.playback.is_paused = true;
        lock.unlock();
        EmitFinished();
        lock.lock();
        continue;
      }
    }

    st.playback.current_frame_index = index;
    st.playback.next_frame_index = index + 1;
    const bool at_end = index >= total - 1;
    if (at_end) st.playback.is_paused = true;
    const int64_t position_ms = PositionMs(index, frame_duration_ms);
    const int target = ComputeTargetSize(st.latency, frame_duration_ms, core.config);
    const bool refill = !at_end && st.buffer.Size() < target / 2;
    st.metrics.frames_emitted++;
    st.metrics.buffer_depth = st.buffer.Size();
    clock.MarkFrameSlot(slot_start);
    lock.unlock();

    EmitFrame(frame, position_ms);
    if (at_end) {
      EmitFinished();
      lock.lock();
      continue;
    }
    if (refill) prefetcher_.Prefetch(PrefetchPriority::kNormal);

    const double spent_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - slot_start).count();
    const auto sleep = clock.SleepDuration(interval_ms, spent_ms);

    lock.lock();
    st.cv.wait_for(lock, sleep, [&st, epoch] {
      return st.playback.is_stopped || st.playback.is_paused ||
             st.epoch != epoch;
    });
  }
  lock.unlock();

  Logger::Info("[PlaybackEngine] LOOP_EXIT");
}

void PlaybackEngine::EmitFrame(const FramePtr& frame, int64_t position_ms) {
  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[PlaybackEngine] FRAME position_ms=" << position_ms;
    Logger::Debug(oss.str());
  }
  if (callbacks_.on_frame_ready) callbacks_.on_frame_ready(frame, position_ms);
}

void PlaybackEngine::EmitFinished() {
  Logger::Info("[PlaybackEngine] PLAYBACK_FINISHED");
  if (callbacks_.on_playback_finished) callbacks_.on_playback_finished();
}

// =============================================================================
// Observability
// =============================================================================

int64_t PlaybackEngine::CurrentPositionMs() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  const SessionState& st = core_->state;
  if (!st.loaded) return 0;
  return PositionMs(st.playback.current_frame_index,
                    st.session.frame_duration_ms);
}

bool PlaybackEngine::IsLoaded() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.loaded;
}

bool PlaybackEngine::IsPaused() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.playback.is_paused;
}

bool PlaybackEngine::IsStopped() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.playback.is_stopped;
}

bool PlaybackEngine::IsLoopRunning() const {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  return loop_thread_.joinable();
}

double PlaybackEngine::Speed() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.playback.speed;
}

int64_t PlaybackEngine::CurrentFrameIndex() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.playback.current_frame_index;
}

Session PlaybackEngine::GetSession() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.session;
}

std::vector<int64_t> PlaybackEngine::BufferedIndices() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  return core_->state.buffer.Indices();
}

EngineMetrics PlaybackEngine::GetMetrics() const {
  std::lock_guard<std::mutex> lock(core_->state.mutex);
  EngineMetrics m = core_->state.metrics;
  m.buffer_depth = core_->state.buffer.Size();
  return m;
}

}  // namespace vidmark::playback
