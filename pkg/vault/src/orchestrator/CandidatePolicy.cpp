// Repository: NarroVault
// Component: Candidate policy
// Purpose: How many candidates to generate per chunk, by text length.
// Copyright (c) 2026 NarroVault

#include "narrovault/orchestrator/CandidatePolicy.hpp"

namespace narrovault::orchestrator {

int CandidatePolicy::CountFor(const inventory::Chunk& chunk) const {
  if (chunk.is_opening && chunk.char_count <= opening_max_chars) return opening_count;
  for (const auto& bucket : buckets) {
    if (chunk.char_count >= bucket.min_chars && chunk.char_count < bucket.max_chars) {
      return bucket.count;
    }
  }
  return fallback_count;
}

}  // namespace narrovault::orchestrator
