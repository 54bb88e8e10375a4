// Repository: NarroVault
// Component: Retry policy
// Purpose: Capped exponential backoff with equal jitter.
// Copyright (c) 2026 NarroVault

#include "narrovault/orchestrator/RetryPolicy.hpp"

#include <algorithm>

namespace narrovault::orchestrator {

BackoffCalculator::BackoffCalculator(RetryPolicy policy, uint64_t seed)
    : policy_(policy), rng_(seed) {}

std::chrono::milliseconds BackoffCalculator::CeilingFor(const RetryPolicy& policy, int retry) {
  if (retry < 1 || policy.base_delay_ms <= 0) return std::chrono::milliseconds(0);
  int64_t d = policy.base_delay_ms;
  for (int i = 1; i < retry && d < policy.max_delay_ms; ++i) d *= 2;
  return std::chrono::milliseconds(std::min(d, policy.max_delay_ms));
}

std::chrono::milliseconds BackoffCalculator::DelayFor(int retry) {
  const int64_t ceiling = CeilingFor(policy_, retry).count();
  if (ceiling <= 0) return std::chrono::milliseconds(0);
  std::uniform_int_distribution<int64_t> dist(ceiling / 2, ceiling);
  std::lock_guard<std::mutex> lock(mutex_);
  return std::chrono::milliseconds(dist(rng_));
}

}  // namespace narrovault::orchestrator
