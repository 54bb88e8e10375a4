// Repository: NarroVault
// Component: Generation orchestrator contract tests
// Purpose: Concurrency cap, retry/backoff, failure outcomes, cancellation
//          and candidate commit semantics.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "FakeSynthesisClient.hpp"
#include "FastTestConfig.hpp"
#include "RecordingWaitStrategy.hpp"
#include "SignalFactory.hpp"
#include "TempVault.hpp"
#include "narrovault/orchestrator/GenerationOrchestrator.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/FileOps.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace narrovault::orchestrator {
namespace {

using synthesis::SynthesisStatus;
using test_infra::FakeSynthesisClient;
using test_infra::RecordingWaitStrategy;

constexpr char kSession[] = "orch-session";

class GenerationOrchestratorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>();
    store_ = std::make_unique<vault::VaultStore>(vault::VaultStoreConfig{dir_.path(), 0.30}, time_);
    client_ = std::make_shared<FakeSynthesisClient>();
    wait_ = std::make_shared<RecordingWaitStrategy>(time_);
    script_ = test_infra::ThreeChunkScript();
  }

  std::unique_ptr<GenerationOrchestrator> Make(OrchestratorConfig cfg) {
    return std::make_unique<GenerationOrchestrator>(cfg, client_, *store_, scoring::ScorerConfig{},
                                                    wait_, time_);
  }

  const inventory::Chunk& ChunkAt(int index) const { return script_.at(index); }

  test_infra::TempDir dir_{"orchestrator"};
  std::shared_ptr<DeterministicTimeSource> time_;
  std::unique_ptr<vault::VaultStore> store_;
  std::shared_ptr<FakeSynthesisClient> client_;
  std::shared_ptr<RecordingWaitStrategy> wait_;
  inventory::ScriptInventory script_;
};

TEST_F(GenerationOrchestratorContractTest, ConcurrencyCapHoldsAcrossFiftyRequests) {
  client_->SetCallLatency(std::chrono::milliseconds(15));
  auto orch = Make(test_infra::FastOrchestratorConfig(/*workers=*/10, /*max_concurrent=*/5));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 50}}, "run-cap");

  EXPECT_LE(client_->Peak(), 5);
  EXPECT_GE(client_->Peak(), 2);
  EXPECT_LE(summary.stats.peak_in_flight, 5);
  EXPECT_EQ(summary.stats.slots_requested, 50u);
  EXPECT_EQ(summary.stats.candidates_written, 50u);
  EXPECT_EQ(client_->CallCount(), 50u);
  ASSERT_EQ(summary.slots.size(), 50u);
  for (const auto& slot : summary.slots) EXPECT_EQ(slot.outcome, SlotOutcome::kCommitted);

  auto all = store_->ListCandidates(kSession, 0, true);
  ASSERT_EQ(all.size(), 50u);
  for (int v = 0; v < 50; ++v) EXPECT_EQ(all[v].version, v);
}

TEST_F(GenerationOrchestratorContractTest, AnalysisFailureIsLoggedAndTheCandidateKeptBelowPrefilter) {
  scoring::ScorerConfig scorer;
  scorer.n_fft = 2;
  GenerationOrchestrator orch(test_infra::FastOrchestratorConfig(1, 1), client_, *store_, scorer,
                              wait_, time_);

  std::vector<std::string> errors;
  RunSummary summary;
  {
    util::ScopedLogCapture capture(
        [&errors](util::LogLevel, const std::string& line) { errors.push_back(line); },
        util::LogLevel::kError);
    summary = orch.Run(kSession, {{ChunkAt(0), 1}}, "run-analysis");
  }

  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kCommitted);
  ASSERT_TRUE(summary.slots[0].candidate.has_value());
  EXPECT_EQ(summary.slots[0].candidate->score_verdict, "analysis_failed");
  EXPECT_TRUE(summary.slots[0].candidate->below_prefilter);

  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].rfind("[GenerationOrchestrator] ANALYSIS_FAILED session=orch-session "
                            "chunk=0 call_id=run-analysis-c0-s0-a1",
                            0),
            0u)
      << errors[0];
}

TEST_F(GenerationOrchestratorContractTest, IntegrityViolationLeavesAnAbortedSummary) {
  // Slot 1's version is taken by a stray file that appears during its call.
  const auto& layout = store_->layout();
  client_->SetResponder([&layout](const synthesis::SynthesisRequest& request) {
    if (request.call_id.find("-s1-") != std::string::npos) {
      vault::WriteFileAtomic(layout.CandidateAudio(kSession, 0, 1), "stray");
    }
    return FakeSynthesisClient::ToneResponse(request);
  });
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  EXPECT_THROW(orch->Run(kSession, {{ChunkAt(0), 3}}, "run-fatal"), IntegrityViolation);

  const RunSummary last = orch->LastSummary();
  EXPECT_EQ(last.run_id, "run-fatal");
  EXPECT_TRUE(last.aborted);
  EXPECT_FALSE(last.cancelled);
  EXPECT_EQ(last.stats.attempts_total, 2u);
  EXPECT_EQ(last.stats.candidates_written, 1u);
  EXPECT_EQ(last.stats.slots_cancelled, 1u);
  EXPECT_GT(last.stats.billed_characters, 0u);
  EXPECT_EQ(client_->CallCount(), 2u);
  EXPECT_EQ(store_->ListCandidates(kSession, 0, true).size(), 1u);
}

TEST_F(GenerationOrchestratorContractTest, ThrottledThreeTimesThenSucceeds) {
  client_->ScriptStatuses(
      {SynthesisStatus::kThrottled, SynthesisStatus::kThrottled, SynthesisStatus::kThrottled});
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}}, "run-throttle");

  ASSERT_EQ(summary.slots.size(), 1u);
  const SlotResult& slot = summary.slots[0];
  EXPECT_EQ(slot.outcome, SlotOutcome::kCommitted);
  EXPECT_EQ(slot.attempts, 4);
  ASSERT_TRUE(slot.candidate.has_value());
  EXPECT_EQ(slot.candidate->attempts, 4);
  EXPECT_EQ(slot.candidate->call_id, "run-throttle-c0-s0-a4");

  // Three waits, each inside its own [d/2, d] band, never shrinking.
  const auto delays = wait_->Delays();
  ASSERT_EQ(delays.size(), 3u);
  const RetryPolicy& policy = orch->config().retry;
  for (int i = 0; i < 3; ++i) {
    const auto ceiling = BackoffCalculator::CeilingFor(policy, i + 1);
    EXPECT_GE(delays[i], ceiling / 2);
    EXPECT_LE(delays[i], ceiling);
    if (i > 0) EXPECT_GE(delays[i], delays[i - 1]);
  }

  EXPECT_EQ(summary.stats.attempts_total, 4u);
  EXPECT_EQ(summary.stats.throttled, 3u);
  EXPECT_EQ(summary.stats.retries, 3u);
  EXPECT_EQ(summary.stats.candidates_written, 1u);
  EXPECT_EQ(store_->ListCandidates(kSession, 0, true).size(), 1u);

  const auto attempts = store_->CallAttempts(kSession);
  ASSERT_EQ(attempts.size(), 4u);
  EXPECT_EQ(attempts[0].status, "THROTTLED");
  EXPECT_EQ(attempts[0].backoff_ms, 0);
  EXPECT_EQ(attempts[3].status, "OK");
  EXPECT_EQ(attempts[3].attempt, 4);
  EXPECT_EQ(attempts[3].backoff_ms, delays[2].count());
}

TEST_F(GenerationOrchestratorContractTest, TransientErrorsExhaustRetries) {
  client_->ScriptStatuses({SynthesisStatus::kTransient, SynthesisStatus::kTimeout,
                           SynthesisStatus::kTransient, SynthesisStatus::kTransient});
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});

  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kTransientOut);
  EXPECT_EQ(summary.slots[0].attempts, 4);
  EXPECT_FALSE(summary.slots[0].candidate.has_value());
  EXPECT_EQ(summary.stats.slots_failed, 1u);
  EXPECT_EQ(summary.stats.transient_errors, 3u);
  EXPECT_EQ(summary.stats.timeouts, 1u);
  EXPECT_EQ(wait_->Delays().size(), 3u);
  EXPECT_EQ(store_->CallAttempts(kSession).size(), 4u);
  EXPECT_TRUE(store_->ListCandidates(kSession, 0, true).empty());
  EXPECT_EQ(store_->PeekNextVersion(kSession, 0), 0);
}

TEST_F(GenerationOrchestratorContractTest, ThrottlingToTheLastAttemptReportsThrottledOut) {
  client_->ScriptStatuses({SynthesisStatus::kThrottled, SynthesisStatus::kThrottled,
                           SynthesisStatus::kThrottled, SynthesisStatus::kThrottled});
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});
  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kThrottledOut);
}

TEST_F(GenerationOrchestratorContractTest, RejectedRequestIsNotRetried) {
  client_->ScriptStatuses({SynthesisStatus::kRejected});
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});

  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kRejected);
  EXPECT_EQ(summary.slots[0].attempts, 1);
  EXPECT_TRUE(wait_->Delays().empty());
  EXPECT_EQ(client_->CallCount(), 1u);
  EXPECT_EQ(summary.stats.rejected, 1u);
}

TEST_F(GenerationOrchestratorContractTest, UndecodableAudioIsAFailedSlotNotACandidate) {
  client_->SetResponder([](const synthesis::SynthesisRequest&) {
    synthesis::SynthesisResponse r;
    r.status = SynthesisStatus::kOk;
    r.audio = {'n', 'o', 't', ' ', 'a', 'u', 'd', 'i', 'o'};
    return r;
  });
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});

  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kDecodeFailed);
  EXPECT_EQ(summary.stats.decode_failures, 1u);
  EXPECT_TRUE(store_->ListCandidates(kSession, 0, true).empty());
  // The attempt itself is still on record.
  ASSERT_EQ(store_->CallAttempts(kSession).size(), 1u);
  EXPECT_EQ(store_->CallAttempts(kSession)[0].status, "OK");
}

TEST_F(GenerationOrchestratorContractTest, TonalDistanceAbsentForOpeningChunk) {
  auto orch = Make(test_infra::FastOrchestratorConfig(2, 2));
  orch->Run(kSession, {{ChunkAt(0), 2}});
  for (const auto& c : store_->ListCandidates(kSession, 0, true)) {
    EXPECT_FALSE(c.tonal_distance_to_prev.has_value());
  }

  auto second = Make(test_infra::FastOrchestratorConfig(2, 2));
  second->Run(kSession, {{ChunkAt(1), 2}});
  const auto chunk1 = store_->ListCandidates(kSession, 1, true);
  ASSERT_EQ(chunk1.size(), 2u);
  for (const auto& c : chunk1) {
    ASSERT_TRUE(c.tonal_distance_to_prev.has_value());
    EXPECT_GE(*c.tonal_distance_to_prev, 0.0);
    EXPECT_LT(*c.tonal_distance_to_prev, 0.1);
  }
}

TEST_F(GenerationOrchestratorContractTest, PickedWinnerIsTheTonalReference) {
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));
  orch->Run(kSession, {{ChunkAt(0), 1}});

  // A second, brighter chunk-0 candidate that is picked.
  client_->SetResponder([](const synthesis::SynthesisRequest& req) {
    return FakeSynthesisClient::ToneResponse(req, 880.0);
  });
  orch->Run(kSession, {{ChunkAt(0), 1}});
  vault::PickRecord pick;
  pick.chunk_index = 0;
  pick.picked_version = 1;
  store_->RecordPick(kSession, pick);

  // Chunk 1 at 880 Hz is closer to the picked 880 Hz reference than a
  // 220 Hz take would be.
  auto next = Make(test_infra::FastOrchestratorConfig(1, 1));
  next->Run(kSession, {{ChunkAt(1), 1}});
  client_->SetResponder(nullptr);
  next->Run(kSession, {{ChunkAt(1), 1}});

  const auto chunk1 = store_->ListCandidates(kSession, 1, true);
  ASSERT_EQ(chunk1.size(), 2u);
  ASSERT_TRUE(chunk1[0].tonal_distance_to_prev.has_value());
  ASSERT_TRUE(chunk1[1].tonal_distance_to_prev.has_value());
  EXPECT_LT(*chunk1[0].tonal_distance_to_prev, *chunk1[1].tonal_distance_to_prev);
}

TEST_F(GenerationOrchestratorContractTest, OvergeneratedAudioIsFlaggedNotDropped) {
  auto cfg = test_infra::FastOrchestratorConfig(1, 1);
  cfg.overgeneration_floor_s = 5.0;
  client_->SetResponder([](const synthesis::SynthesisRequest&) {
    synthesis::SynthesisResponse r;
    r.status = SynthesisStatus::kOk;
    r.audio = test_infra::WavBytes(test_infra::VoicedTone(8.0));
    return r;
  });
  auto orch = Make(cfg);

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});

  ASSERT_EQ(summary.slots.size(), 1u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kCommitted);
  EXPECT_EQ(summary.stats.candidates_below_prefilter, 1u);
  EXPECT_TRUE(store_->ListCandidates(kSession, 0).empty());
  const auto all = store_->ListCandidates(kSession, 0, true);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_TRUE(all[0].below_prefilter);
  EXPECT_EQ(all[0].filter_reason, "overgenerated");
}

TEST_F(GenerationOrchestratorContractTest, NoisyTakeIsKeptBelowPrefilter) {
  client_->SetResponder([](const synthesis::SynthesisRequest&) {
    synthesis::SynthesisResponse r;
    r.status = SynthesisStatus::kOk;
    r.audio = test_infra::WavBytes(test_infra::WhiteNoise(2.0, 0.3));
    return r;
  });
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));
  orch->Run(kSession, {{ChunkAt(0), 1}});

  const auto all = store_->ListCandidates(kSession, 0, true);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_TRUE(all[0].below_prefilter);
  EXPECT_EQ(all[0].filter_reason, "score");
  EXPECT_LT(all[0].composite_score, 0.30);
  EXPECT_TRUE(vault::FileExists(store_->CandidatePath(all[0])));
}

TEST_F(GenerationOrchestratorContractTest, CancelStopsDispatchAndKeepsCommittedWork) {
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));
  GenerationOrchestrator* raw = orch.get();
  std::atomic<int> calls{0};
  orch->SetDelayHook([raw, &calls](int, int, int) {
    if (calls.fetch_add(1) == 0) raw->Cancel();
  });

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 5}});

  EXPECT_TRUE(summary.cancelled);
  ASSERT_EQ(summary.slots.size(), 5u);
  EXPECT_EQ(summary.slots[0].outcome, SlotOutcome::kCommitted);
  for (size_t i = 1; i < summary.slots.size(); ++i) {
    EXPECT_EQ(summary.slots[i].outcome, SlotOutcome::kCancelled);
  }
  EXPECT_EQ(summary.stats.slots_cancelled, 4u);
  EXPECT_EQ(client_->CallCount(), 1u);
  EXPECT_EQ(store_->ListCandidates(kSession, 0, true).size(), 1u);
}

TEST_F(GenerationOrchestratorContractTest, RepeatedRunsOnlyAddVersions) {
  auto orch = Make(test_infra::FastOrchestratorConfig(2, 2));
  orch->Run(kSession, {{ChunkAt(2), 2}});
  const auto before = store_->ListCandidates(kSession, 2, true);
  ASSERT_EQ(before.size(), 2u);

  orch->Run(kSession, {{ChunkAt(2), 2}});
  const auto after = store_->ListCandidates(kSession, 2, true);
  ASSERT_EQ(after.size(), 4u);
  std::set<int> versions;
  for (const auto& c : after) versions.insert(c.version);
  EXPECT_EQ(versions, (std::set<int>{0, 1, 2, 3}));
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(after[i].version, before[i].version);
    EXPECT_DOUBLE_EQ(after[i].composite_score, before[i].composite_score);
    EXPECT_EQ(after[i].call_id, before[i].call_id);
  }
}

TEST_F(GenerationOrchestratorContractTest, BillingFollowsCharactersOfSuccessfulCalls) {
  client_->ScriptStatuses({SynthesisStatus::kThrottled});
  auto cfg = test_infra::FastOrchestratorConfig(1, 1);
  cfg.cost.usd_per_1k_characters = 0.30;
  auto orch = Make(cfg);

  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 2}});

  const uint64_t chars = static_cast<uint64_t>(ChunkAt(0).char_count);
  EXPECT_EQ(summary.stats.attempts_total, 3u);
  EXPECT_EQ(summary.stats.attempted_characters, 3 * chars);
  EXPECT_EQ(summary.stats.billed_characters, 2 * chars);
  EXPECT_NEAR(summary.stats.cost_estimate_usd, 2.0 * chars / 1000.0 * 0.30, 1e-12);
}

TEST_F(GenerationOrchestratorContractTest, PrometheusTextCarriesRunCounters) {
  auto orch = Make(test_infra::FastOrchestratorConfig(1, 1));
  RunSummary summary = orch->Run(kSession, {{ChunkAt(0), 1}});
  const std::string text = summary.stats.GeneratePrometheusText();
  EXPECT_NE(text.find("session=\"orch-session\""), std::string::npos);
  EXPECT_NE(text.find("# TYPE"), std::string::npos);
}

TEST_F(GenerationOrchestratorContractTest, RequiresAClient) {
  EXPECT_THROW(
      { GenerationOrchestrator orch(test_infra::FastOrchestratorConfig(), nullptr, *store_); },
      VaultError);
}

}  // namespace
}  // namespace narrovault::orchestrator
