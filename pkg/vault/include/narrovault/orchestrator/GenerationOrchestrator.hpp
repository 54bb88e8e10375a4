// Repository: NarroVault
// Component: Rate-Limited Generation Orchestrator
// Purpose: Worker pool that turns (chunk, candidate_count) requests into
//          committed candidates: synthesis under a concurrency cap with
//          retry/backoff, decode, score, tonal distance, vault commit.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ORCHESTRATOR_GENERATION_ORCHESTRATOR_HPP_
#define NARROVAULT_ORCHESTRATOR_GENERATION_ORCHESTRATOR_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "narrovault/audio/AudioDecoder.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/orchestrator/CallGate.hpp"
#include "narrovault/orchestrator/IWaitStrategy.hpp"
#include "narrovault/orchestrator/RetryPolicy.hpp"
#include "narrovault/orchestrator/RunStatistics.hpp"
#include "narrovault/scoring/Scorer.hpp"
#include "narrovault/synthesis/ISynthesisClient.hpp"
#include "narrovault/vault/VaultRecords.hpp"
#include "narrovault/vault/VaultStore.hpp"
#include "time/ITimeSource.hpp"

namespace narrovault::orchestrator {

struct CostPolicy {
  double usd_per_1k_characters = 0.30;
  // Whether attempts that returned no audio are billed.
  bool bill_failed_attempts = false;
};

struct OrchestratorConfig {
  int workers = 5;
  // Hard cap on concurrent external calls.
  int max_concurrent_calls = 5;
  std::chrono::milliseconds call_timeout{300'000};
  RetryPolicy retry;
  // 0 seeds the jitter generator from std::random_device.
  uint64_t jitter_seed = 0;
  CostPolicy cost;

  // Overgeneration guard: duration > max(chars / rate * factor, floor).
  double speech_chars_per_second = 15.0;
  double overgeneration_factor = 2.5;
  double overgeneration_floor_s = 20.0;

  synthesis::VoiceSettings voice;
};

struct GenerationRequest {
  inventory::Chunk chunk;
  int candidate_count = 0;
};

enum class SlotOutcome {
  kCommitted,
  kThrottledOut,    // retries exhausted on rate limiting
  kTransientOut,    // retries exhausted on transient / timeout
  kRejected,        // non-retryable
  kDecodeFailed,    // returned bytes were not decodable audio
  kStoreFailed,     // vault write failed (not an integrity violation)
  kCancelled,
};

const char* SlotOutcomeToString(SlotOutcome outcome);

struct SlotResult {
  int chunk_index = 0;
  int slot = 0;
  SlotOutcome outcome = SlotOutcome::kCancelled;
  int attempts = 0;
  std::optional<vault::CandidateRecord> candidate;
  std::string detail;
};

struct RunSummary {
  std::string run_id;
  std::string session_id;
  int64_t started_at_ms = 0;
  int64_t completed_at_ms = 0;
  RunStatistics stats;
  std::vector<SlotResult> slots;  // ordered by (chunk_index, slot)
  bool cancelled = false;
  bool aborted = false;  // a structural failure stopped the run
};

class GenerationOrchestrator {
 public:
  // Test-only: runs inside the call gate just before each external call.
  using DelayHookFn = std::function<void(int chunk_index, int slot, int attempt)>;

  GenerationOrchestrator(OrchestratorConfig config,
                         std::shared_ptr<synthesis::ISynthesisClient> client,
                         vault::VaultStore& store,
                         scoring::ScorerConfig scorer_config = {},
                         std::shared_ptr<IWaitStrategy> wait_strategy = nullptr,
                         std::shared_ptr<ITimeSource> time_source = nullptr);
  ~GenerationOrchestrator();

  GenerationOrchestrator(const GenerationOrchestrator&) = delete;
  GenerationOrchestrator& operator=(const GenerationOrchestrator&) = delete;

  // Blocks until every slot has an outcome or the run is cancelled.
  // Per-slot failures are outcomes in the summary; IntegrityViolation (and
  // any other structural failure) stops the run and is rethrown here.
  RunSummary Run(const std::string& session_id, const std::vector<GenerationRequest>& requests,
                 const std::string& run_id = "");

  // Stops dispatch between work units. Units already committed stay durable;
  // units in flight finish their commit. Safe from any thread, including a
  // signal-driven watcher.
  void Cancel();
  bool IsCancelled() const;

  // Summary of the most recent Run, including one that threw. Statistics of
  // an aborted run cover every attempt made before the failure.
  RunSummary LastSummary() const;

  void SetDelayHook(DelayHookFn hook);

  int PeakInFlight() const { return gate_.Peak(); }
  const OrchestratorConfig& config() const { return config_; }

 private:
  struct WorkItem {
    inventory::Chunk chunk;
    int slot = 0;
  };

  void WorkerLoop();
  SlotResult ProcessItem(const WorkItem& item);
  void CommitCandidate(const WorkItem& item, const synthesis::SynthesisResponse& response,
                       int attempts, const std::string& call_id, SlotResult* result);
  std::optional<double> TonalDistanceToPrevious(int chunk_index,
                                                const scoring::MfccProfile& profile);
  std::optional<scoring::MfccProfile> ReferenceProfile(int chunk_index);
  bool IsOvergenerated(const inventory::Chunk& chunk, double duration_s) const;
  void AccountAttempt(const inventory::Chunk& chunk, const synthesis::SynthesisResponse& response,
                      int64_t call_ms, int64_t backoff_ms);

  OrchestratorConfig config_;
  std::shared_ptr<synthesis::ISynthesisClient> client_;
  vault::VaultStore& store_;
  scoring::Scorer scorer_;
  audio::AudioDecoder decoder_;
  std::shared_ptr<IWaitStrategy> wait_;
  std::shared_ptr<ITimeSource> time_;
  BackoffCalculator backoff_;
  CallGate gate_;

  // Per-run state.
  std::string session_id_;
  std::string run_id_;
  std::map<int, vault::PickRecord> picks_snapshot_;

  mutable std::mutex mutex_;        // queue_, results_, fatal_, delay_hook_, last_summary_
  std::vector<WorkItem> queue_;     // sorted by (chunk_index, slot) ascending
  size_t next_item_ = 0;
  std::vector<SlotResult> results_;
  std::exception_ptr fatal_;
  DelayHookFn delay_hook_;
  RunSummary last_summary_;

  std::mutex stats_mutex_;
  RunStatistics stats_;

  std::mutex profile_mutex_;
  std::map<std::pair<int, int>, scoring::MfccProfile> profile_cache_;  // (chunk, version)

  std::atomic<bool> cancel_requested_{false};
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_GENERATION_ORCHESTRATOR_HPP_
