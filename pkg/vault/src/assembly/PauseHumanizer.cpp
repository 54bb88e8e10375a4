// Repository: NarroVault
// Component: Pause humanizer
// Purpose: Deterministic pause jitter seeded from the session id.
// Copyright (c) 2026 NarroVault

#include "narrovault/assembly/PauseHumanizer.hpp"

#include <algorithm>

namespace narrovault::assembly {

namespace {

// splitmix64 finalizer.
uint64_t Mix(uint64_t x) {
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

}  // namespace

uint64_t StableHash64(const std::string& text) {
  uint64_t h = 0xcbf29ce484222325ull;
  for (unsigned char c : text) {
    h ^= c;
    h *= 0x100000001b3ull;
  }
  return h;
}

JitterPauseHumanizer::JitterPauseHumanizer(const std::string& seed, PauseJitterConfig config)
    : seed_hash_(StableHash64(seed)), config_(config) {}

double JitterPauseHumanizer::PauseAfter(const inventory::Chunk& chunk) const {
  const double declared = chunk.pause_after_s;
  if (declared <= 0.0) return 0.0;
  if (chunk.explicit_pause) return declared;
  if (declared < config_.min_pause_s) return declared;

  const uint64_t bits = Mix(seed_hash_ ^ Mix(static_cast<uint64_t>(chunk.chunk_index)));
  const double unit = static_cast<double>(bits >> 11) * (1.0 / 9007199254740992.0);  // [0, 1)
  const double span = std::min(declared * config_.fraction, config_.max_jitter_s);
  const double jittered = declared + (2.0 * unit - 1.0) * span;
  return std::max(jittered, config_.min_pause_s);
}

}  // namespace narrovault::assembly
