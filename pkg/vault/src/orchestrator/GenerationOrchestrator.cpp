// Repository: NarroVault
// Component: Rate-Limited Generation Orchestrator
// Purpose: Worker pool that turns (chunk, candidate_count) requests into
//          committed candidates.
// Copyright (c) 2026 NarroVault

#include "narrovault/orchestrator/GenerationOrchestrator.hpp"

#include <algorithm>
#include <random>
#include <sstream>
#include <thread>

#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::orchestrator {

using narrovault::util::Logger;
using synthesis::SynthesisStatus;

namespace {

uint64_t ResolveSeed(uint64_t configured) {
  if (configured != 0) return configured;
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

}  // namespace

const char* SlotOutcomeToString(SlotOutcome outcome) {
  switch (outcome) {
    case SlotOutcome::kCommitted: return "COMMITTED";
    case SlotOutcome::kThrottledOut: return "THROTTLED_OUT";
    case SlotOutcome::kTransientOut: return "TRANSIENT_OUT";
    case SlotOutcome::kRejected: return "REJECTED";
    case SlotOutcome::kDecodeFailed: return "DECODE_FAILED";
    case SlotOutcome::kStoreFailed: return "STORE_FAILED";
    case SlotOutcome::kCancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

GenerationOrchestrator::GenerationOrchestrator(OrchestratorConfig config,
                                               std::shared_ptr<synthesis::ISynthesisClient> client,
                                               vault::VaultStore& store,
                                               scoring::ScorerConfig scorer_config,
                                               std::shared_ptr<IWaitStrategy> wait_strategy,
                                               std::shared_ptr<ITimeSource> time_source)
    : config_(std::move(config)),
      client_(std::move(client)),
      store_(store),
      scorer_(scorer_config),
      decoder_(config_.voice.sample_rate > 0 ? config_.voice.sample_rate : audio::kVaultSampleRate),
      wait_(wait_strategy ? std::move(wait_strategy) : std::make_shared<RealtimeWaitStrategy>()),
      time_(time_source ? std::move(time_source) : std::make_shared<SystemTimeSource>()),
      backoff_(config_.retry, ResolveSeed(config_.jitter_seed)),
      gate_(config_.max_concurrent_calls) {
  if (!client_) throw VaultError("GenerationOrchestrator: no synthesis client");
  if (config_.workers < 1) config_.workers = 1;
  if (config_.retry.max_attempts < 1) config_.retry.max_attempts = 1;
}

GenerationOrchestrator::~GenerationOrchestrator() = default;

void GenerationOrchestrator::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!session_id_.empty()) {
    Logger::Info("[GenerationOrchestrator] CANCEL_REQUESTED session=" + session_id_ +
                 " run=" + run_id_);
  }
}

bool GenerationOrchestrator::IsCancelled() const {
  return cancel_requested_.load(std::memory_order_acquire);
}

RunSummary GenerationOrchestrator::LastSummary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_summary_;
}

void GenerationOrchestrator::SetDelayHook(DelayHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_hook_ = std::move(hook);
}

// =============================================================================
// Run: expand requests into slots, drain them with the worker pool
// =============================================================================

RunSummary GenerationOrchestrator::Run(const std::string& session_id,
                                       const std::vector<GenerationRequest>& requests,
                                       const std::string& run_id) {
  RunSummary summary;
  summary.session_id = session_id;
  summary.started_at_ms = time_->NowUtcMs();
  summary.run_id = run_id.empty() ? "run-" + std::to_string(summary.started_at_ms) : run_id;

  store_.EnsureSessionLayout(session_id);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_id_ = session_id;
    run_id_ = summary.run_id;
    queue_.clear();
    next_item_ = 0;
    results_.clear();
    fatal_ = nullptr;
    for (const auto& req : requests) {
      for (int s = 0; s < req.candidate_count; ++s) queue_.push_back(WorkItem{req.chunk, s});
    }
    std::stable_sort(queue_.begin(), queue_.end(), [](const WorkItem& a, const WorkItem& b) {
      if (a.chunk.chunk_index != b.chunk.chunk_index) return a.chunk.chunk_index < b.chunk.chunk_index;
      return a.slot < b.slot;
    });
  }
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = RunStatistics{};
    stats_.session_id = session_id;
    stats_.slots_requested = queue_.size();
  }
  {
    std::lock_guard<std::mutex> lock(profile_mutex_);
    profile_cache_.clear();
  }
  picks_snapshot_ = store_.ActivePicks(session_id);

  std::ostringstream start;
  start << "[GenerationOrchestrator] RUN_START session=" << session_id
        << " run=" << summary.run_id << " slots=" << queue_.size()
        << " workers=" << config_.workers
        << " max_concurrent_calls=" << gate_.capacity();
  Logger::Info(start.str());

  const auto wall_start = std::chrono::steady_clock::now();
  const int n_workers = static_cast<int>(
      std::min<size_t>(static_cast<size_t>(config_.workers), std::max<size_t>(queue_.size(), 1)));
  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(n_workers));
  for (int i = 0; i < n_workers; ++i) {
    workers.emplace_back(&GenerationOrchestrator::WorkerLoop, this);
  }
  for (auto& t : workers) t.join();

  std::exception_ptr fatal;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fatal = fatal_;
    // Slots never dispatched because of cancellation or a fatal error.
    for (size_t i = next_item_; i < queue_.size(); ++i) {
      SlotResult r;
      r.chunk_index = queue_[i].chunk.chunk_index;
      r.slot = queue_[i].slot;
      r.outcome = SlotOutcome::kCancelled;
      results_.push_back(std::move(r));
    }
    next_item_ = queue_.size();
    summary.slots = results_;
  }

  std::sort(summary.slots.begin(), summary.slots.end(), [](const SlotResult& a, const SlotResult& b) {
    if (a.chunk_index != b.chunk_index) return a.chunk_index < b.chunk_index;
    return a.slot < b.slot;
  });

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.peak_in_flight = gate_.Peak();
    // A fatal error also stops dispatch; that is not a user cancellation.
    stats_.cancelled = !fatal && IsCancelled();
    stats_.wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - wall_start)
                         .count();
    stats_.cost_estimate_usd =
        static_cast<double>(stats_.billed_characters) / 1000.0 * config_.cost.usd_per_1k_characters;
    for (const auto& slot : summary.slots) {
      if (slot.outcome == SlotOutcome::kCancelled) ++stats_.slots_cancelled;
    }
    summary.stats = stats_;
  }
  summary.cancelled = summary.stats.cancelled;
  summary.completed_at_ms = time_->NowUtcMs();
  summary.aborted = static_cast<bool>(fatal);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_summary_ = summary;
  }

  if (fatal) {
    std::ostringstream aborted;
    aborted << "[GenerationOrchestrator] RUN_ABORTED session=" << session_id
            << " run=" << summary.run_id
            << " written=" << summary.stats.candidates_written
            << " attempts=" << summary.stats.attempts_total
            << " billed_chars=" << summary.stats.billed_characters;
    Logger::Error(aborted.str());
    std::rethrow_exception(fatal);
  }

  std::ostringstream done;
  done << "[GenerationOrchestrator] RUN_COMPLETE session=" << session_id
       << " run=" << summary.run_id
       << " written=" << summary.stats.candidates_written
       << " failed=" << summary.stats.slots_failed
       << " cancelled_slots=" << summary.stats.slots_cancelled
       << " attempts=" << summary.stats.attempts_total
       << " retries=" << summary.stats.retries
       << " peak_in_flight=" << summary.stats.peak_in_flight
       << " billed_chars=" << summary.stats.billed_characters;
  Logger::Info(done.str());
  return summary;
}

void GenerationOrchestrator::WorkerLoop() {
  while (true) {
    WorkItem item;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (fatal_ || IsCancelled() || next_item_ >= queue_.size()) return;
      item = queue_[next_item_++];
    }

    try {
      SlotResult result = ProcessItem(item);
      std::lock_guard<std::mutex> lock(mutex_);
      results_.push_back(std::move(result));
    } catch (...) {
      // Structural failure: stop every worker and surface it from Run().
      std::lock_guard<std::mutex> lock(mutex_);
      if (!fatal_) fatal_ = std::current_exception();
      cancel_requested_.store(true, std::memory_order_release);
      return;
    }
  }
}

// =============================================================================
// One slot: attempts with backoff, then commit
// =============================================================================

SlotResult GenerationOrchestrator::ProcessItem(const WorkItem& item) {
  SlotResult result;
  result.chunk_index = item.chunk.chunk_index;
  result.slot = item.slot;

  const int max_attempts = config_.retry.max_attempts;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (IsCancelled()) {
      result.outcome = SlotOutcome::kCancelled;
      return result;
    }

    int64_t backoff_ms = 0;
    if (attempt > 1) {
      backoff_ms = backoff_.DelayFor(attempt - 1).count();
      wait_->WaitFor(std::chrono::milliseconds(backoff_ms));
      if (IsCancelled()) {
        result.outcome = SlotOutcome::kCancelled;
        return result;
      }
    }

    std::ostringstream id;
    id << run_id_ << "-c" << item.chunk.chunk_index << "-s" << item.slot << "-a" << attempt;
    const std::string call_id = id.str();

    synthesis::SynthesisRequest request;
    request.call_id = call_id;
    request.attempt = attempt;
    request.text = item.chunk.text;
    request.emotion = item.chunk.emotion;
    request.voice = config_.voice;

    synthesis::SynthesisResponse response;
    const int64_t started_at_ms = time_->NowUtcMs();
    const auto call_start = std::chrono::steady_clock::now();
    {
      CallGateSlot slot(gate_);
      DelayHookFn hook;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = delay_hook_;
      }
      if (hook) hook(item.chunk.chunk_index, item.slot, attempt);
      response = client_->Synthesize(request, config_.call_timeout);
    }
    const int64_t call_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - call_start)
                                .count();
    result.attempts = attempt;
    AccountAttempt(item.chunk, response, call_ms, backoff_ms);

    // The attempt log precedes any vault write for this attempt.
    vault::CallAttemptRecord record;
    record.call_id = call_id;
    record.session_id = session_id_;
    record.chunk_index = item.chunk.chunk_index;
    record.slot = item.slot;
    record.attempt = attempt;
    record.status = synthesis::SynthesisStatusToString(response.status);
    record.started_at_ms = started_at_ms;
    record.duration_ms = call_ms;
    record.characters = item.chunk.char_count;
    record.backoff_ms = backoff_ms;
    record.detail = response.detail;
    store_.AppendCallAttempt(record);

    if (response.status == SynthesisStatus::kOk) {
      CommitCandidate(item, response, attempt, call_id, &result);
      return result;
    }

    std::ostringstream msg;
    msg << "[GenerationOrchestrator] ATTEMPT_FAILED session=" << session_id_
        << " chunk=" << item.chunk.chunk_index << " slot=" << item.slot
        << " attempt=" << attempt << "/" << max_attempts
        << " status=" << synthesis::SynthesisStatusToString(response.status);
    if (!response.detail.empty()) msg << " detail=\"" << response.detail << "\"";

    if (!synthesis::IsRetryable(response.status)) {
      Logger::Error(msg.str());
      result.outcome = SlotOutcome::kRejected;
      result.detail = response.detail;
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.slots_failed;
      return result;
    }

    if (attempt == max_attempts) {
      Logger::Error(msg.str() + " terminal=true");
      result.outcome = response.status == SynthesisStatus::kThrottled ? SlotOutcome::kThrottledOut
                                                                      : SlotOutcome::kTransientOut;
      result.detail = response.detail;
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.slots_failed;
      return result;
    }

    Logger::Warn(msg.str() + " retrying=true");
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.retries;
  }
  // max_attempts >= 1, so every path above returns.
  result.outcome = SlotOutcome::kTransientOut;
  return result;
}

void GenerationOrchestrator::AccountAttempt(const inventory::Chunk& chunk,
                                            const synthesis::SynthesisResponse& response,
                                            int64_t call_ms, int64_t backoff_ms) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.attempts_total;
  stats_.attempted_characters += static_cast<uint64_t>(chunk.char_count);
  stats_.sum_call_ms += call_ms;
  stats_.max_call_ms = std::max(stats_.max_call_ms, call_ms);
  stats_.total_backoff_ms += backoff_ms;

  switch (response.status) {
    case SynthesisStatus::kOk:
      stats_.billed_characters += response.billed_characters > 0
                                      ? response.billed_characters
                                      : static_cast<uint64_t>(chunk.char_count);
      return;
    case SynthesisStatus::kThrottled: ++stats_.throttled; break;
    case SynthesisStatus::kTransient: ++stats_.transient_errors; break;
    case SynthesisStatus::kTimeout: ++stats_.timeouts; break;
    case SynthesisStatus::kRejected: ++stats_.rejected; break;
  }
  if (config_.cost.bill_failed_attempts) {
    stats_.billed_characters += static_cast<uint64_t>(chunk.char_count);
  }
}

void GenerationOrchestrator::CommitCandidate(const WorkItem& item,
                                             const synthesis::SynthesisResponse& response,
                                             int attempts, const std::string& call_id,
                                             SlotResult* result) {
  vault::CandidateDraft draft;
  draft.chunk_index = item.chunk.chunk_index;
  draft.call_id = call_id;
  draft.attempts = attempts;

  std::string error;
  if (!decoder_.DecodeMemory(response.audio, &draft.audio, &error) || draft.audio.empty()) {
    Logger::Error("[GenerationOrchestrator] DECODE_FAILED session=" + session_id_ +
                  " chunk=" + std::to_string(item.chunk.chunk_index) +
                  " call_id=" + call_id + " error=" + error);
    result->outcome = SlotOutcome::kDecodeFailed;
    result->detail = error;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.decode_failures;
    ++stats_.slots_failed;
    return;
  }

  draft.score = scorer_.Score(draft.audio);
  if (draft.score.verdict == scoring::ScoreVerdict::kAnalysisFailed) {
    // Committed anyway, scored zero and below the prefilter.
    Logger::Error("[GenerationOrchestrator] ANALYSIS_FAILED session=" + session_id_ +
                  " chunk=" + std::to_string(item.chunk.chunk_index) +
                  " call_id=" + call_id + " error=" + draft.score.detail);
  }
  if (item.chunk.chunk_index > 0) {
    std::string profile_error;
    const scoring::MfccProfile profile = scorer_.Profile(draft.audio, &profile_error);
    if (!profile_error.empty()) {
      Logger::Warn("[GenerationOrchestrator] PROFILE_FAILED session=" + session_id_ +
                   " chunk=" + std::to_string(item.chunk.chunk_index) +
                   " call_id=" + call_id + " error=" + profile_error);
    }
    draft.tonal_distance_to_prev = TonalDistanceToPrevious(item.chunk.chunk_index, profile);
  }
  draft.overgenerated = IsOvergenerated(item.chunk, draft.audio.DurationSeconds());

  try {
    vault::CandidateRecord rec = store_.WriteCandidate(session_id_, draft);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.candidates_written;
      if (rec.below_prefilter) ++stats_.candidates_below_prefilter;
    }
    result->outcome = SlotOutcome::kCommitted;
    result->candidate = std::move(rec);
  } catch (const IntegrityViolation&) {
    throw;
  } catch (const VaultError& e) {
    Logger::Error(std::string("[GenerationOrchestrator] STORE_FAILED ") + e.what());
    result->outcome = SlotOutcome::kStoreFailed;
    result->detail = e.what();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.slots_failed;
  }
}

bool GenerationOrchestrator::IsOvergenerated(const inventory::Chunk& chunk,
                                             double duration_s) const {
  if (config_.speech_chars_per_second <= 0.0) return false;
  const double expected = static_cast<double>(chunk.char_count) / config_.speech_chars_per_second;
  const double limit = std::max(expected * config_.overgeneration_factor,
                                config_.overgeneration_floor_s);
  return duration_s > limit;
}

// =============================================================================
// Tonal distance against chunk i-1
// =============================================================================

std::optional<double> GenerationOrchestrator::TonalDistanceToPrevious(
    int chunk_index, const scoring::MfccProfile& profile) {
  if (chunk_index <= 0 || profile.empty()) return std::nullopt;
  std::optional<scoring::MfccProfile> reference = ReferenceProfile(chunk_index - 1);
  if (!reference || reference->empty()) return std::nullopt;
  return scoring::Scorer::TonalDistance(profile, *reference);
}

// Picked winner if the previous chunk already has one, otherwise its best
// committed candidate so far. Never waits for the previous chunk.
std::optional<scoring::MfccProfile> GenerationOrchestrator::ReferenceProfile(int chunk_index) {
  std::optional<vault::CandidateRecord> ref;
  auto pick = picks_snapshot_.find(chunk_index);
  if (pick != picks_snapshot_.end()) {
    ref = store_.FindCandidate(session_id_, chunk_index, pick->second.picked_version);
  }
  if (!ref) ref = store_.BestCandidate(session_id_, chunk_index);
  if (!ref) return std::nullopt;

  const auto key = std::make_pair(ref->chunk_index, ref->version);
  {
    std::lock_guard<std::mutex> lock(profile_mutex_);
    auto it = profile_cache_.find(key);
    if (it != profile_cache_.end()) return it->second;
  }

  audio::PcmBuffer pcm;
  std::string error;
  if (!decoder_.DecodeFile(store_.CandidatePath(*ref), &pcm, &error)) {
    Logger::Warn("[GenerationOrchestrator] REFERENCE_UNAVAILABLE chunk=" +
                 std::to_string(chunk_index) + " version=" + std::to_string(ref->version) +
                 " error=" + error);
    return std::nullopt;
  }
  error.clear();
  scoring::MfccProfile profile = scorer_.Profile(pcm, &error);
  if (!error.empty()) {
    Logger::Warn("[GenerationOrchestrator] REFERENCE_PROFILE_FAILED chunk=" +
                 std::to_string(chunk_index) + " version=" + std::to_string(ref->version) +
                 " error=" + error);
  }
  std::lock_guard<std::mutex> lock(profile_mutex_);
  profile_cache_.emplace(key, profile);
  return profile;
}

}  // namespace narrovault::orchestrator
