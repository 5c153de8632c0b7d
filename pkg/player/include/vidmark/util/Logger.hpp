// Repository: Vidmark-player
// Component: Thread-Safe Logger
// Purpose: Leveled line logging shared by the loop, burst and caller threads.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_UTIL_LOGGER_HPP_
#define VIDMARK_UTIL_LOGGER_HPP_

#include <functional>
#include <string>
#include <utility>

namespace vidmark::util {

enum class LogLevel { kDebug = 0, kInfo, kWarn, kError };

const char* ToString(LogLevel level);

// Every line goes through one mutex: the optional sink for its level is
// called, then the line is written whole to its stream and flushed. Lines
// from the playback loop, prefetch bursts and caller threads never interleave.
//
// kDebug, kInfo -> stdout; kWarn, kError -> stderr.
// kDebug is dropped unless VIDMARK_DEBUG was set when the process first
// logged; per-frame call sites test DebugEnabled() before building a line.
//
// Sinks are test hooks. A sink runs under the logger mutex and must not log.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  static bool DebugEnabled();

  // Pass nullptr to clear.
  static void SetSink(LogLevel level, Sink sink);
  static void SetErrorSink(Sink sink) { SetSink(LogLevel::kError, std::move(sink)); }
  static void SetInfoSink(Sink sink) { SetSink(LogLevel::kInfo, std::move(sink)); }

 private:
  static void Emit(LogLevel level, const std::string& line);
};

}  // namespace vidmark::util

#endif  // VIDMARK_UTIL_LOGGER_HPP_
