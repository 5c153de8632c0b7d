// Repository: Vidmark-player
// Component: Engine Configuration
// Purpose: Startup-time tuning for buffering, pacing and decoding.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_PLAYBACK_ENGINE_CONFIG_HPP_
#define VIDMARK_PLAYBACK_ENGINE_CONFIG_HPP_

#include <cstdint>

namespace vidmark::playback {

// EngineConfig holds every heuristic constant of the engine. Values are
// defaults, not contracts; hosts override them at startup (CLI flags,
// environment, platform profile) and never while a session is running.
struct EngineConfig {
  // Decoder
  bool enable_hw_accel = false;
  int output_width = 0;   // 0 = native
  int output_height = 0;  // 0 = native
  int max_decode_threads = 0;  // 0 = auto

  // Buffer sizing: target = clamp(avg_decode_s / frame_s * 2, min, max),
  // default_buffer_size before any latency sample exists.
  int default_buffer_size = 20;
  int min_buffer_size = 5;
  int max_buffer_size = 30;
  int latency_window = 10;

  // Prefetch
  int urgent_threshold = 3;     // urgent burst only when depth < this
  int urgent_burst_frames = 5;
  int prefetch_budget_ms = 100;  // wall-clock cap for one normal fill

  // Pacing
  double min_speed = 0.25;
  double max_speed = 4.0;
  double skip_threshold_ms = 10.0;
  int max_skip_frames = 5;
  bool frame_skip_enabled = true;

  // Profile for hosts known to be resource-constrained: smaller lookahead,
  // no hardware decode hint.
  static EngineConfig Constrained() {
    EngineConfig c;
    c.enable_hw_accel = false;
    c.default_buffer_size = 10;
    return c;
  }
};

// Reads VIDMARK_HW_ACCEL (0/1), VIDMARK_BUFFER_SIZE (int) and
// VIDMARK_FRAME_SKIP (0/1). Unparsable values are ignored with a warning.
void ApplyEnvOverrides(EngineConfig& config);

// Repairs inconsistent values (non-positive sizes, min > max, inverted speed
// bounds) so the engine never runs with an invalid configuration.
EngineConfig Normalize(const EngineConfig& config);

}  // namespace vidmark::playback

#endif  // VIDMARK_PLAYBACK_ENGINE_CONFIG_HPP_
