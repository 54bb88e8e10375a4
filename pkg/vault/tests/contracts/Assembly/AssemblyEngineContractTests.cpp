// Repository: NarroVault
// Component: Assembly Engine contract tests
// Purpose: Complete-picks precondition, timeline arithmetic, loudness
//          targets, byte-reproducible output and never-overwrite numbering.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <memory>
#include <string>

#include "DeterministicTimeSource.hpp"
#include "FastTestConfig.hpp"
#include "SignalFactory.hpp"
#include "TempVault.hpp"
#include "narrovault/assembly/AssemblyEngine.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/FileOps.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace narrovault::assembly {
namespace {

constexpr char kSession[] = "assembly-session";

class AssemblyEngineContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>();
    store_ = std::make_unique<vault::VaultStore>(vault::VaultStoreConfig{dir_.path(), 0.30}, time_);
    store_->EnsureSessionLayout(kSession);
    script_ = test_infra::ThreeChunkScript();

    // One candidate per chunk; lengths 1.5 s, 2.0 s, 1.0 s.
    const double seconds[] = {1.5, 2.0, 1.0};
    for (int i = 0; i < 3; ++i) {
      vault::CandidateDraft d;
      d.chunk_index = i;
      d.audio = test_infra::VoicedTone(seconds[i], 200.0 + 20.0 * i);
      d.score.composite = 0.9;
      d.call_id = "seed-c" + std::to_string(i);
      d.attempts = 1;
      auto rec = store_->WriteCandidate(kSession, d);
      total_speech_samples_ += rec.sample_count;
      vault::PickRecord pick;
      pick.chunk_index = i;
      pick.picked_version = rec.version;
      picks_[i] = pick;
    }
  }

  AssemblyInput Input() const {
    AssemblyInput input;
    input.session_id = kSession;
    input.inventory = script_;
    input.picks = picks_;
    return input;
  }

  AssemblyEngine MakeEngine() const {
    AssemblyConfig cfg;
    cfg.humanize_pauses = false;
    return AssemblyEngine(cfg, *store_);
  }

  test_infra::TempDir dir_{"assembly"};
  std::shared_ptr<DeterministicTimeSource> time_;
  std::unique_ptr<vault::VaultStore> store_;
  inventory::ScriptInventory script_;
  std::map<int, vault::PickRecord> picks_;
  uint64_t total_speech_samples_ = 0;
};

TEST_F(AssemblyEngineContractTest, MissingPickFailsBeforeAnyArtifact) {
  AssemblyInput input = Input();
  input.picks.erase(2);
  AssemblyEngine engine = MakeEngine();
  try {
    engine.Assemble(input);
    FAIL() << "expected IncompletePicksError";
  } catch (const IncompletePicksError& e) {
    EXPECT_EQ(e.missing_chunks(), std::vector<int>{2});
  }
  EXPECT_EQ(engine.stage(), AssemblyStage::kNotStarted);
  EXPECT_TRUE(store_->Assemblies(kSession).empty());
  EXPECT_TRUE(vault::ListDir(store_->layout().FinalDir(kSession)).empty());
}

TEST_F(AssemblyEngineContractTest, PickOfUncommittedVersionIsAnAssemblyError) {
  AssemblyInput input = Input();
  input.picks[1].picked_version = 9;
  AssemblyEngine engine = MakeEngine();
  EXPECT_THROW(engine.Assemble(input), AssemblyError);
}

TEST_F(AssemblyEngineContractTest, DurationIsSpeechPlusDeclaredPauses) {
  AssemblyEngine engine = MakeEngine();
  AssemblyResult result = engine.Assemble(Input());

  const double expected =
      static_cast<double>(total_speech_samples_) / audio::kVaultSampleRate + 3.0;
  EXPECT_NEAR(result.record.duration_seconds, expected, 1e-3);
  EXPECT_NEAR(result.qa.final_duration_s, expected, 1e-3);
  EXPECT_EQ(result.pauses_s, (std::vector<double>{0.0, 3.0, 0.0}));

  // speech, speech, silence, speech
  ASSERT_EQ(result.timeline.size(), 4u);
  EXPECT_EQ(result.timeline[0].kind, SegmentKind::kSpeech);
  EXPECT_EQ(result.timeline[1].kind, SegmentKind::kSpeech);
  EXPECT_EQ(result.timeline[2].kind, SegmentKind::kSilence);
  EXPECT_EQ(result.timeline[2].chunk_index, 1);
  EXPECT_EQ(result.timeline[2].length(), static_cast<size_t>(3 * audio::kVaultSampleRate));
  EXPECT_EQ(result.timeline[3].chunk_index, 2);
  for (size_t i = 1; i < result.timeline.size(); ++i) {
    EXPECT_EQ(result.timeline[i].start_sample, result.timeline[i - 1].end_sample);
  }
}

TEST_F(AssemblyEngineContractTest, OutputMeetsLoudnessTargetsAndPassesQa) {
  AssemblyEngine engine = MakeEngine();
  AssemblyResult result = engine.Assemble(Input());

  EXPECT_EQ(result.stage, AssemblyStage::kQaChecked);
  EXPECT_TRUE(result.qa.passed);
  EXPECT_TRUE(result.record.qa_passed);
  EXPECT_TRUE(result.record.failed_gates.empty());
  EXPECT_NEAR(result.record.integrated_lufs, -26.0, 1.0);
  EXPECT_LE(result.record.true_peak_dbtp, -2.0 + 0.1);
  EXPECT_FALSE(result.peak_limited);

  bool saw_target_gate = false;
  for (const auto& g : result.qa.gates) {
    if (g.name == "target_duration") {
      saw_target_gate = true;
      EXPECT_TRUE(g.skipped);
    }
  }
  EXPECT_TRUE(saw_target_gate);
}

TEST_F(AssemblyEngineContractTest, ArtifactsAreRecordedUnderTheAssemblyNumber) {
  AssemblyEngine engine = MakeEngine();
  AssemblyResult result = engine.Assemble(Input());
  ASSERT_EQ(result.assembly_number, 1);

  const auto& layout = store_->layout();
  for (const char* artifact : {"vault.wav", "vault-raw.wav", "vault.mp3",
                               "assembly-manifest.json", "build-report.json"}) {
    EXPECT_TRUE(vault::FileExists(layout.FinalArtifact(kSession, 1, artifact))) << artifact;
  }
  const auto records = store_->Assemblies(kSession);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].final_wav, "final/assembly-session-a001-vault.wav");
  EXPECT_EQ(records[0].picks.size(), 3u);

  std::string manifest;
  ASSERT_TRUE(vault::ReadFileToString(layout.FinalArtifact(kSession, 1, "assembly-manifest.json"),
                                      &manifest));
  EXPECT_NE(manifest.find("\"type\":\"silence\""), std::string::npos);
}

TEST_F(AssemblyEngineContractTest, ReassemblyIsByteIdenticalAndNeverOverwrites) {
  AssemblyEngine engine = MakeEngine();
  AssemblyResult first = engine.Assemble(Input());
  AssemblyResult second = engine.Assemble(Input());
  EXPECT_EQ(first.assembly_number, 1);
  EXPECT_EQ(second.assembly_number, 2);

  const auto& layout = store_->layout();
  std::string a, b;
  ASSERT_TRUE(vault::ReadFileToString(layout.FinalArtifact(kSession, 1, "vault.wav"), &a));
  ASSERT_TRUE(vault::ReadFileToString(layout.FinalArtifact(kSession, 2, "vault.wav"), &b));
  EXPECT_FALSE(a.empty());
  EXPECT_EQ(a, b);
  EXPECT_EQ(store_->Assemblies(kSession).size(), 2u);
}

TEST_F(AssemblyEngineContractTest, HumanizedPausesAreReproducibleForASession) {
  AssemblyConfig cfg;
  cfg.humanize_pauses = true;
  AssemblyEngine engine(cfg, *store_);
  AssemblyResult first = engine.Assemble(Input());
  AssemblyResult second = engine.Assemble(Input());
  EXPECT_EQ(first.pauses_s, second.pauses_s);
  // The explicit pause is used verbatim.
  EXPECT_DOUBLE_EQ(first.pauses_s[1], 3.0);
}

TEST_F(AssemblyEngineContractTest, FailedGateThrowsButKeepsTheRecord) {
  AssemblyInput input = Input();
  input.target_duration_s = 60.0;
  AssemblyEngine engine = MakeEngine();
  try {
    engine.Assemble(input);
    FAIL() << "expected QaGateFailure";
  } catch (const QaGateFailure& e) {
    EXPECT_EQ(e.failed_gates(), std::vector<std::string>{"target_duration"});
  }
  const auto records = store_->Assemblies(kSession);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_FALSE(records[0].qa_passed);
  EXPECT_EQ(records[0].failed_gates, std::vector<std::string>{"target_duration"});
  EXPECT_TRUE(vault::FileExists(store_->layout().FinalArtifact(kSession, 1, "vault.wav")));
}

TEST_F(AssemblyEngineContractTest, LoudTransientIsLimitedAndLoudnessStillMeetsTarget) {
  // Quiet reads; chunk 1 carries a 5 ms burst near full scale.
  for (int i = 0; i < 3; ++i) {
    vault::CandidateDraft d;
    d.chunk_index = i;
    d.audio = test_infra::VoicedTone(2.0, 200.0 + 20.0 * i, 0.02);
    if (i == 1) {
      const size_t at = audio::PcmBuffer::SamplesFor(1.0, d.audio.sample_rate);
      const size_t len = audio::PcmBuffer::SamplesFor(0.005, d.audio.sample_rate);
      for (size_t n = 0; n < len; ++n) {
        const double hann = 0.5 - 0.5 * std::cos(2.0 * test_infra::kTestPi * n / (len - 1));
        d.audio.samples[at + n] += static_cast<float>(
            0.9 * hann * std::sin(2.0 * test_infra::kTestPi * 997.0 * n / d.audio.sample_rate));
      }
    }
    d.score.composite = 0.9;
    d.call_id = "quiet-c" + std::to_string(i);
    d.attempts = 1;
    picks_[i].picked_version = store_->WriteCandidate(kSession, d).version;
  }

  AssemblyEngine engine = MakeEngine();
  AssemblyResult result = engine.Assemble(Input());

  EXPECT_TRUE(result.peak_limited);
  EXPECT_GT(result.limiter_reduction_db, 6.0);
  EXPECT_TRUE(result.qa.passed);
  EXPECT_NEAR(result.record.integrated_lufs, -26.0, 1.0);
  EXPECT_LE(result.record.true_peak_dbtp, -2.0 + 0.1);
  for (const auto& g : result.qa.gates) {
    if (g.name == "integrated_loudness" || g.name == "true_peak") {
      EXPECT_TRUE(g.passed) << g.name << " " << g.detail;
    }
  }
}

TEST_F(AssemblyEngineContractTest, CandidateFilesAreNotModified) {
  const auto before = store_->ListCandidates(kSession, 0, true);
  ASSERT_EQ(before.size(), 1u);
  std::string original;
  ASSERT_TRUE(vault::ReadFileToString(store_->CandidatePath(before[0]), &original));

  AssemblyEngine engine = MakeEngine();
  engine.Assemble(Input());

  std::string after;
  ASSERT_TRUE(vault::ReadFileToString(store_->CandidatePath(before[0]), &after));
  EXPECT_EQ(original, after);
}

}  // namespace
}  // namespace narrovault::assembly
