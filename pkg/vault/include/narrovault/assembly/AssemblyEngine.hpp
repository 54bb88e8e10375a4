// Repository: NarroVault
// Component: Assembly Engine
// Purpose: Deterministic mixdown of one picked candidate per chunk into the
//          session's final artifacts, followed by the QA gate battery.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ASSEMBLY_ASSEMBLY_ENGINE_HPP_
#define NARROVAULT_ASSEMBLY_ASSEMBLY_ENGINE_HPP_

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "narrovault/assembly/AssemblyTypes.hpp"
#include "narrovault/assembly/PauseHumanizer.hpp"
#include "narrovault/assembly/QaGates.hpp"
#include "narrovault/audio/AudioDecoder.hpp"
#include "narrovault/audio/AudioEncoder.hpp"
#include "narrovault/audio/LoudnessMeter.hpp"
#include "narrovault/audio/PcmBuffer.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/vault/VaultRecords.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace narrovault::assembly {

struct AssemblyInput {
  std::string session_id;
  inventory::ScriptInventory inventory;
  std::map<int, vault::PickRecord> picks;  // chunk_index -> active pick
  std::optional<double> target_duration_s;
};

struct AssemblyResult {
  int assembly_number = 0;
  AssemblyStage stage = AssemblyStage::kNotStarted;
  Timeline timeline;
  std::vector<double> pauses_s;  // per chunk, after humanization
  audio::LoudnessMeasurement raw_loudness;
  double applied_gain_db = 0.0;
  bool peak_limited = false;     // the true-peak limiter engaged
  double limiter_reduction_db = 0.0;
  bool lra_above_target = false;
  QaReport qa;
  vault::AssemblyRecord record;
};

// Half-sine fade over the first and last fade_samples (shortened for very
// short buffers so the two fades never overlap).
void ApplyEdgeFades(audio::PcmBuffer& pcm, size_t fade_samples);

// Assembly never modifies candidate audio; every artifact lands under a fresh
// assembly number, so earlier assemblies are never overwritten.
class AssemblyEngine {
 public:
  // humanizer: nullptr selects a JitterPauseHumanizer seeded from the
  // session id (or IdentityPauseHumanizer when config.humanize_pauses is
  // false).
  AssemblyEngine(AssemblyConfig config, vault::VaultStore& store,
                 std::shared_ptr<IPauseHumanizer> humanizer = nullptr, QaConfig qa_config = {});

  // Throws IncompletePicksError when a chunk lacks a pick, AssemblyError for
  // a failed stage, QaGateFailure when a gate fails (artifacts and the
  // assembly record are kept).
  AssemblyResult Assemble(const AssemblyInput& input);

  // Last stage completed by the most recent Assemble call.
  AssemblyStage stage() const { return stage_; }
  const AssemblyConfig& config() const { return config_; }

 private:
  struct PickedChunk {
    inventory::Chunk chunk;
    vault::CandidateRecord candidate;
    audio::PcmBuffer audio;
  };

  std::vector<PickedChunk> LoadPicks(const AssemblyInput& input);
  void FadeChunks(std::vector<PickedChunk>& chunks) const;
  std::vector<double> ResolvePauses(const std::string& session_id,
                                    const std::vector<PickedChunk>& chunks) const;
  audio::PcmBuffer Concatenate(const std::vector<PickedChunk>& chunks,
                               const std::vector<double>& pauses, Timeline* timeline) const;
  audio::PcmBuffer Normalize(const std::string& session_id, const audio::PcmBuffer& raw,
                             AssemblyResult* result) const;
  void Encode(const std::string& session_id, const audio::PcmBuffer& raw,
              const audio::PcmBuffer& final_pcm, AssemblyResult* result);
  void PublishArtifact(const std::string& session_id, const audio::PcmBuffer& pcm,
                       const audio::EncodeSettings& settings, const std::string& path);
  void PublishText(const std::string& session_id, const std::string& content,
                   const std::string& path);
  std::string ManifestJson(const std::string& session_id, const AssemblyResult& result) const;
  std::string ReportJson(const std::string& session_id, const AssemblyInput& input,
                         const AssemblyResult& result) const;

  AssemblyConfig config_;
  vault::VaultStore& store_;
  std::shared_ptr<IPauseHumanizer> humanizer_;
  QaGates qa_;
  audio::AudioDecoder decoder_;
  audio::AudioEncoder encoder_;
  AssemblyStage stage_ = AssemblyStage::kNotStarted;
};

}  // namespace narrovault::assembly

#endif  // NARROVAULT_ASSEMBLY_ASSEMBLY_ENGINE_HPP_
