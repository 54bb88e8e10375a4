// Repository: NarroVault
// Component: Pause humanizer
// Purpose: Turns a chunk's declared pause into the silence actually inserted
//          after it during assembly.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ASSEMBLY_PAUSE_HUMANIZER_HPP_
#define NARROVAULT_ASSEMBLY_PAUSE_HUMANIZER_HPP_

#include <cstdint>
#include <string>

#include "narrovault/inventory/InventoryTypes.hpp"

namespace narrovault::assembly {

// Implementations must be pure in (chunk): the same chunk always yields the
// same duration, so assembly stays byte-reproducible.
class IPauseHumanizer {
 public:
  virtual ~IPauseHumanizer() = default;
  // Seconds of silence after the chunk; never negative.
  virtual double PauseAfter(const inventory::Chunk& chunk) const = 0;
};

// Declared durations, untouched.
class IdentityPauseHumanizer : public IPauseHumanizer {
 public:
  double PauseAfter(const inventory::Chunk& chunk) const override {
    return chunk.pause_after_s > 0.0 ? chunk.pause_after_s : 0.0;
  }
};

struct PauseJitterConfig {
  // Jitter is uniform in +/- fraction * pause, capped at max_jitter_s.
  double fraction = 0.10;
  double max_jitter_s = 0.40;
  // Humanized pauses never drop below this (declared pauses shorter than it
  // are left alone).
  double min_pause_s = 0.30;
};

// Adds small deterministic jitter to non-explicit pauses. The draw for a
// chunk depends only on (seed, chunk_index). Explicit pauses and zero pauses
// pass through exactly.
class JitterPauseHumanizer : public IPauseHumanizer {
 public:
  explicit JitterPauseHumanizer(const std::string& seed, PauseJitterConfig config = {});

  double PauseAfter(const inventory::Chunk& chunk) const override;

  uint64_t seed_hash() const { return seed_hash_; }

 private:
  uint64_t seed_hash_;
  PauseJitterConfig config_;
};

// FNV-1a 64; stable across platforms and standard libraries.
uint64_t StableHash64(const std::string& text);

}  // namespace narrovault::assembly

#endif  // NARROVAULT_ASSEMBLY_PAUSE_HUMANIZER_HPP_
