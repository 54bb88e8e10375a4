// Repository: NarroVault
// Component: Timestamp formatting
// Purpose: ISO-8601 UTC timestamps for log envelopes and manifests.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_UTIL_TIME_FORMAT_HPP_
#define NARROVAULT_UTIL_TIME_FORMAT_HPP_

#include <cstdint>
#include <string>

namespace narrovault::util {

// "2026-03-01T12:00:00.000Z". Returns an empty string if the time cannot be
// represented.
std::string FormatIso8601Utc(int64_t utc_ms);

}  // namespace narrovault::util

#endif  // NARROVAULT_UTIL_TIME_FORMAT_HPP_
