// Repository: Vidmark-player
// Component: Engine Configuration
// Purpose: Environment overrides and normalization for EngineConfig.
// Copyright (c) 2025 Vidmark

#include "vidmark/playback/EngineConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <string>

#include "vidmark/util/Logger.hpp"

namespace vidmark::playback {

using vidmark::util::Logger;

namespace {

bool ParseFlag(const char* name, const char* value, bool& out) {
  std::string v(value);
  if (v == "1" || v == "true" || v == "on") {
    out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "off") {
    out = false;
    return true;
  }
  std::ostringstream oss;
  oss << "[EngineConfig] Ignoring " << name << "=" << v << " (expected 0/1)";
  Logger::Warn(oss.str());
  return false;
}

bool ParseInt(const char* name, const char* value, int& out) {
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || *end != '\0' || parsed <= 0 || parsed > 1000) {
    std::ostringstream oss;
    oss << "[EngineConfig] Ignoring " << name << "=" << value
        << " (expected integer in 1..1000)";
    Logger::Warn(oss.str());
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

}  // namespace

void ApplyEnvOverrides(EngineConfig& config) {
  if (const char* v = std::getenv("VIDMARK_HW_ACCEL")) {
    ParseFlag("VIDMARK_HW_ACCEL", v, config.enable_hw_accel);
  }
  if (const char* v = std::getenv("VIDMARK_BUFFER_SIZE")) {
    ParseInt("VIDMARK_BUFFER_SIZE", v, config.default_buffer_size);
  }
  if (const char* v = std::getenv("VIDMARK_FRAME_SKIP")) {
    ParseFlag("VIDMARK_FRAME_SKIP", v, config.frame_skip_enabled);
  }
}

EngineConfig Normalize(const EngineConfig& config) {
  EngineConfig c = config;
  c.min_buffer_size = std::max(1, c.min_buffer_size);
  c.max_buffer_size = std::max(c.min_buffer_size, c.max_buffer_size);
  c.default_buffer_size =
      std::clamp(c.default_buffer_size, c.min_buffer_size, c.max_buffer_size);
  c.latency_window = std::max(1, c.latency_window);
  c.urgent_threshold = std::max(0, c.urgent_threshold);
  c.urgent_burst_frames = std::max(1, c.urgent_burst_frames);
  c.prefetch_budget_ms = std::max(1, c.prefetch_budget_ms);
  c.max_skip_frames = std::max(0, c.max_skip_frames);
  c.skip_threshold_ms = std::max(0.0, c.skip_threshold_ms);
  c.output_width = std::max(0, c.output_width);
  c.output_height = std::max(0, c.output_height);
  if (!(c.min_speed > 0.0)) c.min_speed = 0.25;
  if (!(c.max_speed >= c.min_speed)) c.max_speed = c.min_speed;
  return c;
}

}  // namespace vidmark::playback
