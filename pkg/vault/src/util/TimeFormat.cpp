// Repository: NarroVault
// Component: Timestamp formatting
// Purpose: ISO-8601 UTC timestamps for log envelopes and manifests.
// Copyright (c) 2026 NarroVault

#include "narrovault/util/TimeFormat.hpp"

#include <cstdio>
#include <ctime>

namespace narrovault::util {

std::string FormatIso8601Utc(int64_t utc_ms) {
  time_t s = static_cast<time_t>(utc_ms / 1000);
  int frac_ms = static_cast<int>(utc_ms % 1000);
  if (frac_ms < 0) {
    frac_ms += 1000;
    s -= 1;
  }
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return {};
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                        tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return {};
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace narrovault::util
