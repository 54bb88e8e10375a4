// Repository: NarroVault
// Component: Session Pipeline
// Purpose: Coordinates register -> generate -> pick -> assemble for one
//          session, persisting every status transition and mirroring every
//          written file to the configured backups.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SESSION_SESSION_PIPELINE_HPP_
#define NARROVAULT_SESSION_SESSION_PIPELINE_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "narrovault/assembly/AssemblyEngine.hpp"
#include "narrovault/assembly/AssemblyTypes.hpp"
#include "narrovault/assembly/PauseHumanizer.hpp"
#include "narrovault/assembly/QaGates.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/inventory/InventoryValidator.hpp"
#include "narrovault/orchestrator/CandidatePolicy.hpp"
#include "narrovault/orchestrator/GenerationOrchestrator.hpp"
#include "narrovault/orchestrator/IWaitStrategy.hpp"
#include "narrovault/scoring/Scorer.hpp"
#include "narrovault/session/SessionStateMachine.hpp"
#include "narrovault/synthesis/ISynthesisClient.hpp"
#include "narrovault/vault/BackupMirror.hpp"
#include "narrovault/vault/RunLock.hpp"
#include "narrovault/vault/VaultRecords.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace narrovault::session {

struct PipelineConfig {
  orchestrator::OrchestratorConfig orchestrator;
  orchestrator::CandidatePolicy candidates;
  inventory::ChunkPolicy chunk_policy;
  // When false, length-policy violations are logged but do not block
  // registration.
  bool require_vault_ready = false;
  scoring::ScorerConfig scorer;
  assembly::AssemblyConfig assembly;
  assembly::QaConfig qa;
  vault::RunLockPolicy lock_policy = vault::RunLockPolicy::kReject;
};

struct GenerateOptions {
  // Extra versions per chunk on top of the policy target.
  int extra = 0;
  // Restricts the run to these chunk indices (empty: every chunk).
  std::vector<int> only_chunks;
  std::string run_id;
};

struct ChunkPlan {
  int chunk_index = 0;
  int char_count = 0;
  int target = 0;    // policy count
  int existing = 0;  // committed candidates, flagged ones included
  int to_generate = 0;
};

struct GenerationPlan {
  std::string session_id;
  std::string script_id;
  std::vector<ChunkPlan> chunks;
  int total_new_candidates = 0;
  uint64_t total_characters = 0;
  double estimated_cost_usd = 0.0;
};

struct ChunkStatus {
  int chunk_index = 0;
  int candidates = 0;
  int below_prefilter = 0;
  std::optional<double> best_score;
  std::optional<int> picked_version;
};

struct SessionStatusReport {
  vault::SessionManifest manifest;
  SessionStatus status = SessionStatus::kPending;
  std::vector<ChunkStatus> chunks;
  int assemblies = 0;
  uint64_t illegal_transitions = 0;
};

class SessionPipeline {
 public:
  SessionPipeline(PipelineConfig config, vault::VaultStore& store,
                  std::shared_ptr<synthesis::ISynthesisClient> client,
                  std::vector<std::shared_ptr<vault::IBackupMirror>> mirrors = {},
                  std::shared_ptr<orchestrator::IWaitStrategy> wait_strategy = nullptr,
                  std::shared_ptr<assembly::IPauseHumanizer> humanizer = nullptr);

  SessionPipeline(const SessionPipeline&) = delete;
  SessionPipeline& operator=(const SessionPipeline&) = delete;

  // Validates the inventory, appends new or changed chunks to the global
  // inventory, creates the session layout and records PENDING. Throws
  // InventoryInvalid, or VaultError when the session belongs to another
  // script.
  void Register(const std::string& session_id, const inventory::ScriptInventory& inventory);

  // Dry run: what Generate would request and what it would cost.
  GenerationPlan Plan(const std::string& session_id, const GenerateOptions& options = {}) const;

  // Holds the system-wide run lock for the whole run. Per-slot failures are
  // reported in the summary; throws RunInProgress, BackupIncomplete,
  // IntegrityViolation or VaultError. A run stopped by IntegrityViolation
  // is still logged (marked aborted) and mirrored before the rethrow.
  orchestrator::RunSummary Generate(const std::string& session_id,
                                    const GenerateOptions& options = {});

  // Appends a pick. Completing the pick set moves the session to
  // PICKS_COMPLETE; changing a pick of an assembled session reopens it.
  void RecordPick(const std::string& session_id, const vault::PickRecord& pick);

  // Throws IncompletePicksError, AssemblyError, QaGateFailure (status
  // QA_FAILED, artifacts kept) or BackupIncomplete.
  assembly::AssemblyResult Assemble(const std::string& session_id,
                                    std::optional<double> target_duration_s = std::nullopt);

  SessionStatusReport Status(const std::string& session_id) const;
  SessionStatus CurrentStatus(const std::string& session_id) const;

  // Stops the active generation between work units. Safe from any thread.
  void Cancel();

  // Recomputes the manifest from the durable logs and writes it atomically.
  vault::SessionManifest RefreshManifest(const std::string& session_id);

  const PipelineConfig& config() const { return config_; }

 private:
  struct SessionContext {
    vault::SessionManifest manifest;
    inventory::ScriptInventory inventory;
  };

  SessionContext LoadContext(const std::string& session_id) const;
  std::vector<ChunkPlan> BuildPlan(const SessionContext& ctx,
                                   const GenerateOptions& options) const;
  SessionStateMachine& MachineFor(const std::string& session_id) const;
  void TransitionTo(const std::string& session_id, SessionStatus to, const std::string& reason);
  void ReopenSession(const std::string& session_id, const std::string& reason);
  bool AllChunksHaveCandidates(const SessionContext& ctx) const;

  // Mirrors every path the store wrote since the last call. Returns false
  // (after logging each failure) when any mirror missed a file.
  bool MirrorWrittenFiles(const std::string& session_id);

  // Appends the run to the generation log, refreshes the manifest and
  // mirrors. Returns false when the backup is incomplete.
  bool RecordRun(const std::string& session_id, const orchestrator::RunSummary& summary);

  PipelineConfig config_;
  vault::VaultStore& store_;
  std::shared_ptr<synthesis::ISynthesisClient> client_;
  std::vector<std::shared_ptr<vault::IBackupMirror>> mirrors_;
  std::shared_ptr<orchestrator::IWaitStrategy> wait_;
  std::shared_ptr<assembly::IPauseHumanizer> humanizer_;
  inventory::InventoryValidator validator_;

  mutable std::mutex machines_mutex_;
  mutable std::map<std::string, std::unique_ptr<SessionStateMachine>> machines_;

  std::mutex active_mutex_;
  orchestrator::GenerationOrchestrator* active_ = nullptr;  // not owned
  bool cancel_pending_ = false;
};

}  // namespace narrovault::session

#endif  // NARROVAULT_SESSION_SESSION_PIPELINE_HPP_
