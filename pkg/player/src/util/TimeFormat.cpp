// Repository: Vidmark-player
// Component: Time Formatting
// Purpose: Millisecond positions to and from human-readable time codes.
// Copyright (c) 2025 Vidmark

#include "vidmark/util/TimeFormat.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <vector>

namespace vidmark::util {

namespace {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour = 60 * kMsPerMinute;

// Non-empty run of at most 9 decimal digits.
bool ParseDigits(const std::string& text, int64_t& out) {
  if (text.empty() || text.size() > 9) return false;
  int64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

std::vector<std::string> Split(const std::string& text, char sep) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    std::string::size_type pos = text.find(sep, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

}  // namespace

std::string FormatTimeMs(int64_t milliseconds) {
  milliseconds = std::max<int64_t>(0, milliseconds);
  const long long ms = milliseconds % 1000;
  const long long seconds = (milliseconds / kMsPerSecond) % 60;
  const long long minutes = (milliseconds / kMsPerMinute) % 60;
  const long long hours = milliseconds / kMsPerHour;

  char buf[48];
  if (hours > 0) {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld", hours,
                  minutes, seconds, ms);
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld.%03lld", minutes, seconds,
                  ms);
  }
  return buf;
}

std::string FormatTimeCompact(int64_t milliseconds) {
  milliseconds = std::max<int64_t>(0, milliseconds);
  const long long seconds = (milliseconds / kMsPerSecond) % 60;
  const long long minutes = milliseconds / kMsPerMinute;

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld", minutes, seconds);
  return buf;
}

std::optional<int64_t> ParseTimeCode(const std::string& time_code) {
  const std::vector<std::string> parts = Split(time_code, ':');
  if (parts.size() != 2 && parts.size() != 3) return std::nullopt;

  // Last field: seconds with an optional fraction.
  const std::vector<std::string> sec_parts = Split(parts.back(), '.');
  if (sec_parts.size() > 2) return std::nullopt;

  int64_t seconds = 0;
  if (!ParseDigits(sec_parts[0], seconds) || seconds >= 60) return std::nullopt;

  int64_t fraction_ms = 0;
  if (sec_parts.size() == 2) {
    const std::string& frac = sec_parts[1];
    if (frac.size() > 3 || !ParseDigits(frac, fraction_ms)) return std::nullopt;
    for (size_t i = frac.size(); i < 3; ++i) fraction_ms *= 10;
  }

  int64_t minutes = 0;
  int64_t hours = 0;
  if (parts.size() == 3) {
    if (!ParseDigits(parts[0], hours)) return std::nullopt;
    if (!ParseDigits(parts[1], minutes) || minutes >= 60) return std::nullopt;
  } else if (!ParseDigits(parts[0], minutes)) {
    return std::nullopt;
  }

  return hours * kMsPerHour + minutes * kMsPerMinute + seconds * kMsPerSecond +
         fraction_ms;
}

}  // namespace vidmark::util
