// Repository: NarroVault
// Component: Vault Store
// Purpose: Durable, append-only storage of inventories, candidates, call
//          attempts, picks, status transitions and assemblies. Candidate
//          versions are allocated atomically and never reused; committed
//          files are never overwritten.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_VAULT_STORE_HPP_
#define NARROVAULT_VAULT_VAULT_STORE_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "narrovault/audio/AudioEncoder.hpp"
#include "narrovault/audio/PcmBuffer.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/scoring/Scorer.hpp"
#include "narrovault/vault/LogWriter.hpp"
#include "narrovault/vault/VaultLayout.hpp"
#include "narrovault/vault/VaultRecords.hpp"
#include "time/ITimeSource.hpp"

namespace narrovault::vault {

struct VaultStoreConfig {
  std::string root;
  // Candidates scoring strictly below this are flagged, never deleted.
  double prefilter_threshold = 0.30;
};

// Everything the orchestrator knows about a finished synthesis before the
// store assigns it a version.
struct CandidateDraft {
  int chunk_index = 0;
  audio::PcmBuffer audio;
  scoring::ScoreResult score;
  std::optional<double> tonal_distance_to_prev;
  bool overgenerated = false;
  std::string call_id;
  int attempts = 0;
};

class VaultStore {
 public:
  explicit VaultStore(VaultStoreConfig config,
                      std::shared_ptr<ITimeSource> time_source = nullptr);
  ~VaultStore();

  VaultStore(const VaultStore&) = delete;
  VaultStore& operator=(const VaultStore&) = delete;

  const VaultLayout& layout() const { return layout_; }
  double prefilter_threshold() const { return config_.prefilter_threshold; }

  static bool IsBelowPrefilter(double composite, double threshold) {
    return composite < threshold;
  }

  // ---- sessions -----------------------------------------------------------

  // Creates the session directory tree. Throws VaultError for an unusable id.
  void EnsureSessionLayout(const std::string& session_id);
  bool SessionExists(const std::string& session_id) const;

  // ---- inventory ----------------------------------------------------------

  // Appends the chunks whose content differs from their latest recorded
  // revision (plus a script header when the shape changed). Returns the
  // number of chunk records appended.
  int RecordInventory(const inventory::ScriptInventory& inventory);
  std::optional<inventory::ScriptInventory> LoadInventory(const std::string& script_id) const;

  // ---- candidates ---------------------------------------------------------

  // Allocates the next version, publishes the WAV without replacing any
  // file, then appends the metadata record durably. Throws VaultError on
  // I/O failure, IntegrityViolation if a committed file would be replaced.
  CandidateRecord WriteCandidate(const std::string& session_id, const CandidateDraft& draft);

  // Committed candidates (those with a metadata record) ordered by version.
  // Pre-filtered candidates are listed only on request.
  std::vector<CandidateRecord> ListCandidates(const std::string& session_id, int chunk_index,
                                              bool include_below_prefilter = false) const;
  std::optional<CandidateRecord> FindCandidate(const std::string& session_id, int chunk_index,
                                               int version) const;
  // Highest composite among unflagged candidates, else among all; ties go to
  // the lower version.
  std::optional<CandidateRecord> BestCandidate(const std::string& session_id,
                                               int chunk_index) const;
  // Version the next WriteCandidate for the chunk would receive.
  int PeekNextVersion(const std::string& session_id, int chunk_index) const;

  std::string CandidatePath(const CandidateRecord& record) const;

  // ---- call attempts ------------------------------------------------------

  uint64_t AppendCallAttempt(const CallAttemptRecord& attempt);
  std::vector<CallAttemptRecord> CallAttempts(const std::string& session_id) const;

  // ---- picks --------------------------------------------------------------

  // Throws VaultError when the pick names no committed candidate.
  void RecordPick(const std::string& session_id, const PickRecord& pick);
  // Latest pick per chunk.
  std::map<int, PickRecord> ActivePicks(const std::string& session_id) const;

  // ---- status -------------------------------------------------------------

  void AppendStatus(const std::string& session_id, const StatusRecord& status);
  std::vector<StatusRecord> StatusHistory(const std::string& session_id) const;

  // ---- generation runs ----------------------------------------------------

  void AppendGenerationLog(const GenerationLogEntry& entry);
  std::vector<GenerationLogEntry> GenerationLog() const;

  // ---- assemblies ---------------------------------------------------------

  int NextAssemblyNumber(const std::string& session_id) const;
  void AppendAssembly(const std::string& session_id, const AssemblyRecord& record);
  std::vector<AssemblyRecord> Assemblies(const std::string& session_id) const;

  // ---- manifest -----------------------------------------------------------

  void WriteManifest(const SessionManifest& manifest);
  std::optional<SessionManifest> ReadManifest(const std::string& session_id) const;

  // ---- backup bookkeeping -------------------------------------------------

  // Absolute paths written since the last call, in write order.
  std::vector<std::string> TakeWrittenPaths();
  void NoteWritten(const std::string& path);

  ITimeSource& time_source() const { return *time_source_; }

 private:
  struct ChunkState {
    int next_version = 0;
    std::vector<CandidateRecord> records;
  };

  ChunkState& LoadChunkLocked(const std::string& session_id, int chunk_index) const;
  void RequireSession(const std::string& session_id) const;

  VaultStoreConfig config_;
  VaultLayout layout_;
  std::shared_ptr<ITimeSource> time_source_;
  audio::AudioEncoder encoder_;

  mutable std::mutex mutex_;
  mutable std::map<std::pair<std::string, int>, ChunkState> chunks_;
  std::vector<std::string> written_paths_;
  std::set<std::string> written_seen_;

  // Declared last: destroyed first, so queued records drain while the rest
  // of the store is still alive.
  std::unique_ptr<LogWriter> writer_;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_VAULT_STORE_HPP_
