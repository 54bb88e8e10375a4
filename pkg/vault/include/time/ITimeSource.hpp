// Repository: NarroVault
// Component: Time source
// Purpose: Wall-clock seam for record timestamps and run durations.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_TIME_I_TIME_SOURCE_HPP_
#define NARROVAULT_TIME_I_TIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace narrovault {

// Every timestamp written to the vault comes from one of these, so tests
// can pin record times.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  // Milliseconds since the Unix epoch, UTC.
  virtual int64_t NowUtcMs() const = 0;
};

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

}  // namespace narrovault

#endif  // NARROVAULT_TIME_I_TIME_SOURCE_HPP_
