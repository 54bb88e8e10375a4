// Repository: NarroVault
// Component: Candidate policy
// Purpose: How many candidates to generate per chunk, by text length.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ORCHESTRATOR_CANDIDATE_POLICY_HPP_
#define NARROVAULT_ORCHESTRATOR_CANDIDATE_POLICY_HPP_

#include <vector>

#include "narrovault/inventory/InventoryTypes.hpp"

namespace narrovault::orchestrator {

// Chunks with min_chars <= char_count < max_chars get `count` candidates.
struct CandidateBucket {
  int min_chars = 0;
  int max_chars = 0;
  int count = 0;
};

struct CandidatePolicy {
  // Short openings are the most exposed; they get the opening count.
  int opening_max_chars = 60;
  int opening_count = 30;

  std::vector<CandidateBucket> buckets{
      {0, 50, 30},
      {50, 100, 15},
      {100, 200, 20},
      {200, 300, 25},
  };
  int fallback_count = 25;

  int CountFor(const inventory::Chunk& chunk) const;
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_CANDIDATE_POLICY_HPP_
