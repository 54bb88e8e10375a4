// Repository: NarroVault
// Component: Session Pipeline contract tests
// Purpose: End-to-end register -> generate -> pick -> assemble against a fake
//          synthesis service, plus single-flight runs, idempotent re-runs,
//          reopen semantics and backup accounting.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "FakeSynthesisClient.hpp"
#include "FastTestConfig.hpp"
#include "RecordingWaitStrategy.hpp"
#include "TempVault.hpp"
#include "narrovault/session/SessionPipeline.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/BackupMirror.hpp"
#include "narrovault/vault/FileOps.hpp"
#include "narrovault/vault/RunLock.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace narrovault::session {
namespace {

constexpr char kSession[] = "evening-01";

// Accepts nothing.
class FailingMirror : public vault::IBackupMirror {
 public:
  bool Mirror(const std::string&, const std::string& relative_path, std::string* error) override {
    *error = "backup volume offline: " + relative_path;
    return false;
  }
  bool Flush(std::string*) override { return true; }
};

class SessionPipelineContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>();
    store_ = std::make_unique<vault::VaultStore>(vault::VaultStoreConfig{vault_.path(), 0.30}, time_);
    client_ = std::make_shared<test_infra::FakeSynthesisClient>();
    wait_ = std::make_shared<test_infra::RecordingWaitStrategy>(time_);
    mirror_ = std::make_shared<vault::DirectoryMirror>(backup_.path());
    pipeline_ = MakePipeline({mirror_});
  }

  std::unique_ptr<SessionPipeline> MakePipeline(
      std::vector<std::shared_ptr<vault::IBackupMirror>> mirrors) {
    return std::make_unique<SessionPipeline>(test_infra::FastPipelineConfig(2), *store_, client_,
                                             std::move(mirrors), wait_);
  }

  // Picks the best candidate of every chunk; returns (chunk -> version).
  std::map<int, int> PickBest(SessionPipeline& pipeline) {
    std::map<int, int> picked;
    for (int i = 0; i < 3; ++i) {
      auto best = store_->BestCandidate(kSession, i);
      EXPECT_TRUE(best.has_value());
      if (!best) continue;
      vault::PickRecord pick;
      pick.chunk_index = i;
      pick.picked_version = best->version;
      pipeline.RecordPick(kSession, pick);
      picked[i] = best->version;
    }
    return picked;
  }

  std::vector<std::string> StatusTrail() const {
    std::vector<std::string> trail;
    for (const auto& rec : store_->StatusHistory(kSession)) trail.push_back(rec.to);
    return trail;
  }

  test_infra::TempDir vault_{"pipeline_vault"};
  test_infra::TempDir backup_{"pipeline_backup"};
  std::shared_ptr<DeterministicTimeSource> time_;
  std::unique_ptr<vault::VaultStore> store_;
  std::shared_ptr<test_infra::FakeSynthesisClient> client_;
  std::shared_ptr<test_infra::RecordingWaitStrategy> wait_;
  std::shared_ptr<vault::DirectoryMirror> mirror_;
  std::unique_ptr<SessionPipeline> pipeline_;
};

TEST_F(SessionPipelineContractTest, EndToEndProducesAPassingAssembly) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kPending);

  const auto summary = pipeline_->Generate(kSession);
  EXPECT_EQ(summary.stats.candidates_written, 6u);
  EXPECT_FALSE(summary.cancelled);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kCandidatesReady);

  const auto picked = PickBest(*pipeline_);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kPicksComplete);

  uint64_t speech_samples = 0;
  for (const auto& [chunk, version] : picked) {
    auto rec = store_->FindCandidate(kSession, chunk, version);
    ASSERT_TRUE(rec.has_value());
    speech_samples += rec->sample_count;
  }

  const auto result = pipeline_->Assemble(kSession);
  EXPECT_TRUE(result.qa.passed);
  EXPECT_NEAR(result.record.duration_seconds,
              static_cast<double>(speech_samples) / audio::kVaultSampleRate + 3.0, 1e-3);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaPassed);
  EXPECT_EQ(StatusTrail(), (std::vector<std::string>{"PENDING", "CANDIDATES_READY",
                                                     "PICKS_COMPLETE", "ASSEMBLED", "QA_PASSED"}));

  const auto manifest = store_->ReadManifest(kSession);
  ASSERT_TRUE(manifest.has_value());
  EXPECT_EQ(manifest->status, "QA_PASSED");
  EXPECT_EQ(manifest->total_candidates, 6u);
  EXPECT_EQ(manifest->total_api_calls, 6u);
  EXPECT_EQ(manifest->picks_recorded, 3);
  EXPECT_EQ(manifest->last_assembly, 1);
  EXPECT_EQ(manifest->chunks_below_prefilter, 0);
}

TEST_F(SessionPipelineContractTest, EveryWrittenFileReachesTheBackup) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);
  PickBest(*pipeline_);
  pipeline_->Assemble(kSession);

  const auto& layout = store_->layout();
  auto backed_up = [&](const std::string& path) {
    return vault::FileExists(backup_.path() + "/" + layout.Relative(path));
  };
  EXPECT_TRUE(backed_up(layout.InventoryLog()));
  EXPECT_TRUE(backed_up(layout.GenerationLog()));
  EXPECT_TRUE(backed_up(layout.SessionManifest(kSession)));
  EXPECT_TRUE(backed_up(layout.CallLog(kSession)));
  EXPECT_TRUE(backed_up(layout.PickLog(kSession)));
  EXPECT_TRUE(backed_up(layout.FinalArtifact(kSession, 1, "vault.mp3")));
  for (int chunk = 0; chunk < 3; ++chunk) {
    for (const auto& c : store_->ListCandidates(kSession, chunk, true)) {
      EXPECT_TRUE(backed_up(store_->CandidatePath(c))) << c.audio_file;
    }
  }

  const auto runs = store_->GenerationLog();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_TRUE(runs[0].backup_complete);
}

TEST_F(SessionPipelineContractTest, FailedMirrorSurfacesBackupIncomplete) {
  auto pipeline = MakePipeline({std::make_shared<FailingMirror>()});
  std::vector<std::string> errors;
  {
    util::ScopedLogCapture capture(
        [&errors](util::LogLevel, const std::string& line) { errors.push_back(line); },
        util::LogLevel::kError);
    EXPECT_THROW(pipeline->Register(kSession, test_infra::ThreeChunkScript()),
                 BackupIncomplete);
  }
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors[0].rfind("[SessionPipeline] BACKUP_FAILED session=evening-01", 0), 0u)
      << errors[0];
  // The vault itself is intact.
  EXPECT_TRUE(store_->SessionExists(kSession));

  EXPECT_THROW(pipeline->Generate(kSession), BackupIncomplete);
  const auto runs = store_->GenerationLog();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_FALSE(runs[0].backup_complete);
  EXPECT_EQ(runs[0].candidates_written, 6u);
}

TEST_F(SessionPipelineContractTest, AbortedRunIsStillLoggedBilledAndMirrored) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());

  // Once the run is under way, a stray file appears where chunk 1's first
  // candidate will be published; that commit becomes an integrity violation.
  const auto& layout = store_->layout();
  const std::string stray = layout.CandidateAudio(kSession, 1, 0);
  auto planted = std::make_shared<std::once_flag>();
  client_->SetResponder([&layout, stray, planted](const synthesis::SynthesisRequest& request) {
    if (request.call_id.find("-c1-") != std::string::npos) {
      std::call_once(*planted, [&layout, &stray] {
        vault::MakeDirs(layout.ChunkDir(kSession, 1));
        vault::WriteFileAtomic(stray, "not a candidate");
      });
    }
    return test_infra::FakeSynthesisClient::ToneResponse(request);
  });

  std::vector<std::string> errors;
  {
    util::ScopedLogCapture capture(
        [&errors](util::LogLevel, const std::string& line) { errors.push_back(line); },
        util::LogLevel::kError);
    EXPECT_THROW(pipeline_->Generate(kSession), IntegrityViolation);
  }
  bool saw_abort = false;
  for (const auto& line : errors) {
    if (line.rfind("[SessionPipeline] GENERATE_ABORTED session=evening-01", 0) == 0) {
      saw_abort = true;
    }
  }
  EXPECT_TRUE(saw_abort);

  const auto runs = store_->GenerationLog();
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_TRUE(runs[0].aborted);
  EXPECT_FALSE(runs[0].cancelled);
  EXPECT_TRUE(runs[0].backup_complete);
  EXPECT_EQ(runs[0].total_api_calls, client_->CallCount());
  EXPECT_GT(runs[0].billed_characters, 0u);

  // Both chunk 0 slots were dispatched ahead of the failing commit.
  uint64_t committed = 0;
  for (int chunk = 0; chunk < 3; ++chunk) {
    committed += store_->ListCandidates(kSession, chunk, true).size();
  }
  EXPECT_GE(committed, 2u);
  EXPECT_EQ(runs[0].candidates_written, committed);

  const auto manifest = store_->ReadManifest(kSession);
  ASSERT_TRUE(manifest.has_value());
  EXPECT_EQ(manifest->total_candidates, committed);
  EXPECT_EQ(manifest->billed_characters, runs[0].billed_characters);
  EXPECT_EQ(manifest->total_api_calls, client_->CallCount());

  auto backed_up = [&](const std::string& path) {
    return vault::FileExists(backup_.path() + "/" + layout.Relative(path));
  };
  EXPECT_TRUE(backed_up(layout.GenerationLog()));
  EXPECT_TRUE(backed_up(layout.SessionManifest(kSession)));
  for (const auto& c : store_->ListCandidates(kSession, 0, true)) {
    EXPECT_TRUE(backed_up(store_->CandidatePath(c))) << c.audio_file;
  }

  // The run lock was released; a later run completes and is not marked.
  ASSERT_TRUE(vault::FileExists(stray));
  ASSERT_EQ(std::remove(stray.c_str()), 0);
  pipeline_->Generate(kSession);
  const auto after = store_->GenerationLog();
  ASSERT_EQ(after.size(), 2u);
  EXPECT_FALSE(after[1].aborted);
}

TEST_F(SessionPipelineContractTest, SecondGenerateRequestsNothingAndChangesNothing) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);

  std::map<std::string, std::string> before;
  for (int chunk = 0; chunk < 3; ++chunk) {
    for (const auto& c : store_->ListCandidates(kSession, chunk, true)) {
      ASSERT_TRUE(vault::ReadFileToString(store_->CandidatePath(c), &before[c.audio_file]));
    }
  }
  const size_t calls_before = client_->CallCount();

  const GenerationPlan plan = pipeline_->Plan(kSession);
  EXPECT_EQ(plan.total_new_candidates, 0);
  for (const auto& p : plan.chunks) {
    EXPECT_EQ(p.existing, 2);
    EXPECT_EQ(p.to_generate, 0);
  }

  const auto summary = pipeline_->Generate(kSession);
  EXPECT_EQ(summary.stats.slots_requested, 0u);
  EXPECT_EQ(client_->CallCount(), calls_before);

  std::map<std::string, std::string> after;
  for (int chunk = 0; chunk < 3; ++chunk) {
    for (const auto& c : store_->ListCandidates(kSession, chunk, true)) {
      ASSERT_TRUE(vault::ReadFileToString(store_->CandidatePath(c), &after[c.audio_file]));
    }
  }
  EXPECT_EQ(before, after);
}

TEST_F(SessionPipelineContractTest, ExtraAndChunkFilterShapeThePlan) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  GenerateOptions options;
  options.extra = 3;
  options.only_chunks = {1};
  const GenerationPlan plan = pipeline_->Plan(kSession, options);
  ASSERT_EQ(plan.chunks.size(), 1u);
  EXPECT_EQ(plan.chunks[0].chunk_index, 1);
  EXPECT_EQ(plan.chunks[0].to_generate, 5);
  EXPECT_EQ(plan.total_characters, 5u * static_cast<uint64_t>(plan.chunks[0].char_count));

  pipeline_->Generate(kSession, options);
  EXPECT_EQ(store_->ListCandidates(kSession, 1, true).size(), 5u);
  EXPECT_TRUE(store_->ListCandidates(kSession, 0, true).empty());
  // Not every chunk has candidates yet.
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kPending);

  options.only_chunks = {7};
  EXPECT_THROW(pipeline_->Plan(kSession, options), VaultError);
}

TEST_F(SessionPipelineContractTest, ConcurrentRunIsRejected) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  vault::RunLock held(store_->layout().LockFile(), vault::RunLockPolicy::kReject);
  EXPECT_THROW(pipeline_->Generate(kSession), RunInProgress);
  EXPECT_EQ(client_->CallCount(), 0u);
}

TEST_F(SessionPipelineContractTest, CancelBeforeRunCancelsOnlyTheNextRun) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Cancel();
  const auto cancelled = pipeline_->Generate(kSession);
  EXPECT_TRUE(cancelled.cancelled);
  EXPECT_EQ(cancelled.stats.candidates_written, 0u);
  EXPECT_EQ(client_->CallCount(), 0u);

  const auto normal = pipeline_->Generate(kSession);
  EXPECT_FALSE(normal.cancelled);
  EXPECT_EQ(normal.stats.candidates_written, 6u);
}

TEST_F(SessionPipelineContractTest, ChangingAPickReopensAnAssembledSession) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);
  const auto picked = PickBest(*pipeline_);
  pipeline_->Assemble(kSession);
  ASSERT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaPassed);

  // Re-recording the same pick is not a change.
  vault::PickRecord same;
  same.chunk_index = 1;
  same.picked_version = picked.at(1);
  pipeline_->RecordPick(kSession, same);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaPassed);

  vault::PickRecord other = same;
  other.picked_version = picked.at(1) == 0 ? 1 : 0;
  pipeline_->RecordPick(kSession, other);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kPicksComplete);
  const auto history = store_->StatusHistory(kSession);
  ASSERT_FALSE(history.empty());
  EXPECT_TRUE(history.back().reopen);
  EXPECT_EQ(history.back().from, "QA_PASSED");

  const auto second = pipeline_->Assemble(kSession);
  EXPECT_EQ(second.assembly_number, 2);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaPassed);
  EXPECT_EQ(store_->Assemblies(kSession).size(), 2u);
}

TEST_F(SessionPipelineContractTest, QaFailureIsRecordedAsAStatus) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);
  PickBest(*pipeline_);
  EXPECT_THROW(pipeline_->Assemble(kSession, 600.0), QaGateFailure);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaFailed);
  EXPECT_EQ(store_->ReadManifest(kSession)->status, "QA_FAILED");

  // Reassembly without the target reopens and passes.
  pipeline_->Assemble(kSession);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kQaPassed);
}

TEST_F(SessionPipelineContractTest, AssembleWithoutAllPicksFails) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);
  vault::PickRecord pick;
  pick.chunk_index = 0;
  pick.picked_version = 0;
  pipeline_->RecordPick(kSession, pick);
  EXPECT_THROW(pipeline_->Assemble(kSession), IncompletePicksError);
  EXPECT_EQ(pipeline_->CurrentStatus(kSession), SessionStatus::kCandidatesReady);
}

TEST_F(SessionPipelineContractTest, StatusSurvivesAFreshPipeline) {
  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  pipeline_->Generate(kSession);
  PickBest(*pipeline_);

  auto fresh = MakePipeline({});
  EXPECT_EQ(fresh->CurrentStatus(kSession), SessionStatus::kPicksComplete);
  const SessionStatusReport report = fresh->Status(kSession);
  ASSERT_EQ(report.chunks.size(), 3u);
  for (const auto& c : report.chunks) {
    EXPECT_EQ(c.candidates, 2);
    EXPECT_TRUE(c.picked_version.has_value());
    ASSERT_TRUE(c.best_score.has_value());
    EXPECT_GE(*c.best_score, 0.30);
  }
  EXPECT_EQ(report.illegal_transitions, 0u);
}

TEST_F(SessionPipelineContractTest, RegistrationRejectsBadInput) {
  auto broken = inventory::ScriptInventory::FromBlocks(
      "broken", "sleep", "calm", {{"First line of the script here.", 0.0, false}, {"", 0.0, false}});
  EXPECT_THROW(pipeline_->Register("broken-01", broken), InventoryInvalid);
  EXPECT_FALSE(store_->SessionExists("broken-01"));

  pipeline_->Register(kSession, test_infra::ThreeChunkScript());
  EXPECT_THROW(pipeline_->Register(kSession, test_infra::ThreeChunkScript("another-script")),
               VaultError);
  // Re-registering the same script is harmless.
  EXPECT_NO_THROW(pipeline_->Register(kSession, test_infra::ThreeChunkScript()));
  EXPECT_EQ(store_->StatusHistory(kSession).size(), 1u);
}

TEST_F(SessionPipelineContractTest, StrictPolicyBlocksShortChunks) {
  auto cfg = test_infra::FastPipelineConfig(2);
  cfg.require_vault_ready = true;
  SessionPipeline strict(cfg, *store_, client_, {}, wait_);
  // "Goodbye for now." is below the minimum chunk length.
  EXPECT_THROW(strict.Register(kSession, test_infra::ThreeChunkScript()), InventoryInvalid);
}

}  // namespace
}  // namespace narrovault::session
