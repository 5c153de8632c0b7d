// Repository: Vidmark-player
// Component: Time Formatting
// Purpose: Millisecond positions to and from human-readable time codes.
// Copyright (c) 2025 Vidmark

#ifndef VIDMARK_UTIL_TIME_FORMAT_HPP_
#define VIDMARK_UTIL_TIME_FORMAT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace vidmark::util {

// "HH:MM:SS.mmm" when the position reaches one hour, else "MM:SS.mmm".
// Negative input formats as zero.
std::string FormatTimeMs(int64_t milliseconds);

// "MM:SS"; minutes keep counting past 59.
std::string FormatTimeCompact(int64_t milliseconds);

// Parses "HH:MM:SS[.mmm]" or "MM:SS[.mmm]". The fraction is 1-3 digits
// ("1.5" is 1500 ms). Seconds and minutes fields must be below 60 when a
// larger unit precedes them. Returns nullopt for anything else.
std::optional<int64_t> ParseTimeCode(const std::string& time_code);

}  // namespace vidmark::util

#endif  // VIDMARK_UTIL_TIME_FORMAT_HPP_
