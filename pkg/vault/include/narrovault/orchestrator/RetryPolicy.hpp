// Repository: NarroVault
// Component: Retry policy
// Purpose: Capped exponential backoff with equal jitter for throttled and
//          transient synthesis failures.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ORCHESTRATOR_RETRY_POLICY_HPP_
#define NARROVAULT_ORCHESTRATOR_RETRY_POLICY_HPP_

#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace narrovault::orchestrator {

struct RetryPolicy {
  // Total attempts per candidate slot, first call included.
  int max_attempts = 4;
  int64_t base_delay_ms = 2000;
  int64_t max_delay_ms = 30000;
};

// Draws backoff delays. Thread-safe; a fixed seed gives a reproducible
// sequence of draws.
class BackoffCalculator {
 public:
  BackoffCalculator(RetryPolicy policy, uint64_t seed);

  // d_n = min(base * 2^(n-1), max) for retry n >= 1.
  static std::chrono::milliseconds CeilingFor(const RetryPolicy& policy, int retry);

  // Uniform in [d_n / 2, d_n].
  std::chrono::milliseconds DelayFor(int retry);

  const RetryPolicy& policy() const { return policy_; }

 private:
  RetryPolicy policy_;
  std::mutex mutex_;
  std::mt19937_64 rng_;
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_RETRY_POLICY_HPP_
