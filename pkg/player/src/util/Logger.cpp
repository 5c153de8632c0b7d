// Repository: Vidmark-player
// Component: Thread-Safe Logger
// Purpose: Leveled line logging shared by the loop, burst and caller threads.
// Copyright (c) 2025 Vidmark

#include "vidmark/util/Logger.hpp"

#include <array>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <utility>

namespace vidmark::util {

namespace {

struct LoggerState {
  std::mutex mutex;
  std::array<Logger::Sink, 4> sinks;
};

// Never destroyed: detached burst threads may log during static teardown.
LoggerState& State() {
  static LoggerState* state = new LoggerState();
  return *state;
}

size_t SlotOf(LogLevel level) {
  return static_cast<size_t>(level);
}

}  // namespace

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo:  return "info";
    case LogLevel::kWarn:  return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("VIDMARK_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(LogLevel level, Sink sink) {
  LoggerState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.sinks[SlotOf(level)] = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  LoggerState& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  const Sink& sink = state.sinks[SlotOf(level)];
  if (sink) sink(line);

  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace vidmark::util
