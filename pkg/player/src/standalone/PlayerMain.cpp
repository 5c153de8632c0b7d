// Repository: Vidmark-player
// Component: Standalone Player Harness
// Purpose: Command-line driver for the playback engine (diagnostics and
//          decoder bring-up without the review UI).
// Copyright (c) 2025 Vidmark
//
// Frames are decoded and paced exactly as in the application, but only
// counted (and optionally logged), never displayed.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "vidmark/decode/FFmpegFrameSource.h"
#include "vidmark/playback/EngineConfig.hpp"
#include "vidmark/playback/PlaybackEngine.hpp"
#include "vidmark/util/TimeFormat.hpp"

namespace {

using vidmark::playback::EngineConfig;
using vidmark::playback::FramePtr;
using vidmark::playback::PlaybackEngine;
using vidmark::playback::PlaybackError;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input_path;
  std::optional<int64_t> seek_ms;
  double speed = 1.0;
  int64_t duration_ms = 0;  // 0 = until end of stream
  int step_frames = 0;      // > 0: paused stepping instead of playback
  int buffer_size = 0;      // 0 = config default
  bool verbose = false;
  bool no_skip = false;
  bool hw_accel = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] FILE\n"
            << "\n"
            << "Plays FILE through the playback engine and reports delivery.\n"
            << "\n"
            << "PLAYBACK:\n"
            << "  --seek POS           Start position: HH:MM:SS.mmm, MM:SS.mmm or ms\n"
            << "  --speed X            Playback speed (clamped to 0.25..4.0)\n"
            << "  --duration-ms MS     Stop after MS of wall-clock playback\n"
            << "  --step N             Stay paused and step forward N frames\n"
            << "\n"
            << "ENGINE:\n"
            << "  --buffer N           Default lookahead size in frames\n"
            << "  --no-skip            Disable frame skipping when behind\n"
            << "  --hw-accel           Try hardware decoding\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --verbose            Print every delivered frame\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  VIDMARK_HW_ACCEL, VIDMARK_BUFFER_SIZE, VIDMARK_FRAME_SKIP,\n"
            << "  VIDMARK_DEBUG (per-frame engine tracing)\n"
            << "\n"
            << "EXAMPLES:\n"
            << "    " << program_name << " --seek 01:30.000 --speed 2 clip.mp4\n"
            << "    " << program_name << " --step 10 --verbose clip.mp4\n"
            << "\n";
}

std::optional<int64_t> ParsePosition(const std::string& text) {
  if (auto ms = vidmark::util::ParseTimeCode(text)) return ms;
  size_t consumed = 0;
  long long value = std::stoll(text, &consumed);
  if (consumed != text.size() || value < 0) return std::nullopt;
  return static_cast<int64_t>(value);
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--seek" && i + 1 < argc) {
        args.seek_ms = ParsePosition(argv[++i]);
        if (!args.seek_ms) {
          args.error = std::string("Invalid --seek position: ") + argv[i];
          return args;
        }
      } else if (arg == "--speed" && i + 1 < argc) {
        args.speed = std::stod(argv[++i]);
      } else if (arg == "--duration-ms" && i + 1 < argc) {
        args.duration_ms = std::stoll(argv[++i]);
      } else if (arg == "--step" && i + 1 < argc) {
        args.step_frames = std::stoi(argv[++i]);
      } else if (arg == "--buffer" && i + 1 < argc) {
        args.buffer_size = std::stoi(argv[++i]);
      } else if (arg == "--verbose") {
        args.verbose = true;
      } else if (arg == "--no-skip") {
        args.no_skip = true;
      } else if (arg == "--hw-accel") {
        args.hw_accel = true;
      } else if (!arg.empty() && arg[0] != '-' && args.input_path.empty()) {
        args.input_path = arg;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric argument (") + e.what() + ")";
    return args;
  }

  if (args.input_path.empty()) {
    args.error = "Must specify an input FILE";
    return args;
  }
  if (args.duration_ms < 0 || args.step_frames < 0 || args.buffer_size < 0) {
    args.error = "--duration-ms, --step and --buffer must not be negative";
    return args;
  }

  args.valid = true;
  return args;
}

EngineConfig BuildConfig(const CliArgs& args) {
  EngineConfig config;
  vidmark::playback::ApplyEnvOverrides(config);
  if (args.hw_accel) config.enable_hw_accel = true;
  if (args.no_skip) config.frame_skip_enabled = false;
  if (args.buffer_size > 0) config.default_buffer_size = args.buffer_size;
  return vidmark::playback::Normalize(config);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  const EngineConfig config = BuildConfig(args);
  const auto decoder_config =
      vidmark::decode::DecoderConfig::FromEngineConfig(config);

  std::atomic<int64_t> frames_received{0};
  std::atomic<int64_t> last_position_ms{0};
  std::atomic<bool> finished{false};
  const bool verbose = args.verbose;

  PlaybackEngine::Callbacks callbacks;
  callbacks.on_duration_changed = [](int64_t total_ms) {
    std::cout << "[PLAYER] duration " << vidmark::util::FormatTimeMs(total_ms)
              << " (" << total_ms << " ms)" << std::endl;
  };
  callbacks.on_frame_ready = [&](const FramePtr& frame, int64_t position_ms) {
    frames_received.fetch_add(1, std::memory_order_relaxed);
    last_position_ms.store(position_ms, std::memory_order_relaxed);
    if (verbose) {
      std::cout << "[PLAYER] frame " << vidmark::util::FormatTimeMs(position_ms)
                << " " << frame->width << "x" << frame->height << std::endl;
    }
  };
  callbacks.on_playback_finished = [&finished]() {
    finished.store(true, std::memory_order_release);
  };

  PlaybackEngine engine(
      [decoder_config]() {
        return std::make_unique<vidmark::decode::FFmpegFrameSource>(decoder_config);
      },
      callbacks, config);

  PlaybackError err = engine.Load(args.input_path);
  if (err != PlaybackError::kNone) {
    std::cerr << "Error: cannot load " << args.input_path << ": "
              << vidmark::playback::ToString(err) << "\n";
    return 2;
  }

  const double speed = engine.SetSpeed(args.speed);
  if (speed != args.speed) {
    std::cerr << "[PLAYER] speed " << args.speed << " clamped to " << speed
              << "\n";
  }

  if (args.seek_ms) {
    err = engine.Seek(static_cast<double>(*args.seek_ms));
    if (err != PlaybackError::kNone) {
      std::cerr << "Error: seek failed: " << vidmark::playback::ToString(err)
                << "\n";
    }
  }

  const auto started = std::chrono::steady_clock::now();
  if (args.step_frames > 0) {
    for (int i = 0; i < args.step_frames; ++i) {
      if (g_termination_requested.load(std::memory_order_acquire)) break;
      if (!engine.StepForward()) {
        std::cout << "[PLAYER] step stopped at "
                  << vidmark::util::FormatTimeMs(engine.CurrentPositionMs())
                  << std::endl;
        break;
      }
    }
  } else {
    engine.Play();
    while (!finished.load(std::memory_order_acquire) &&
           !g_termination_requested.load(std::memory_order_acquire)) {
      if (args.duration_ms > 0 &&
          std::chrono::steady_clock::now() - started >=
              std::chrono::milliseconds(args.duration_ms)) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  if (g_termination_requested.load(std::memory_order_acquire)) {
    std::cerr << "\n[PLAYER] Termination requested, stopping engine\n";
  }

  const int64_t final_position = engine.CurrentPositionMs();
  engine.Stop();

  const auto metrics = engine.GetMetrics();
  const double wall_s = std::chrono::duration<double>(
      std::chrono::steady_clock::now() - started).count();

  std::cout << "\n=== Playback Summary ===\n"
            << "Frames delivered: " << frames_received.load() << "\n"
            << "Frames skipped:   " << metrics.frames_skipped << " in "
            << metrics.skip_events << " events (max "
            << metrics.max_skip_in_event << ")\n"
            << "Direct decodes:   " << metrics.direct_decodes << "\n"
            << "Decode failures:  " << metrics.decode_failures << "\n"
            << "Final position:   " << vidmark::util::FormatTimeMs(final_position)
            << "\n"
            << "Last delivered:   "
            << vidmark::util::FormatTimeMs(last_position_ms.load()) << "\n"
            << "Wall time:        " << wall_s << " s\n"
            << "Finished:         " << (finished.load() ? "yes" : "no")
            << std::endl;
  return 0;
}
