// Repository: NarroVault
// Component: Vault layout
// Purpose: Path scheme of the on-disk vault. Every file the vault owns is
//          named here and nowhere else.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_VAULT_LAYOUT_HPP_
#define NARROVAULT_VAULT_VAULT_LAYOUT_HPP_

#include <string>

namespace narrovault::vault {

// <root>/inventory.jsonl
// <root>/generation-log.jsonl
// <root>/.generation.lock
// <root>/<session>/session-manifest.json
// <root>/<session>/status-log.jsonl
// <root>/<session>/api-calls.jsonl
// <root>/<session>/cNN/cNN_vVVV.wav
// <root>/<session>/cNN/cNN_meta.jsonl
// <root>/<session>/picks/picks.jsonl
// <root>/<session>/final/assemblies.jsonl
// <root>/<session>/final/<session>-aAAA-<artifact>
class VaultLayout {
 public:
  explicit VaultLayout(std::string root);

  const std::string& root() const { return root_; }

  std::string InventoryLog() const;
  std::string GenerationLog() const;
  std::string LockFile() const;

  std::string SessionDir(const std::string& session_id) const;
  std::string SessionManifest(const std::string& session_id) const;
  std::string StatusLog(const std::string& session_id) const;
  std::string CallLog(const std::string& session_id) const;

  std::string ChunkDir(const std::string& session_id, int chunk_index) const;
  std::string CandidateAudio(const std::string& session_id, int chunk_index, int version) const;
  std::string CandidateMetaLog(const std::string& session_id, int chunk_index) const;

  std::string PicksDir(const std::string& session_id) const;
  std::string PickLog(const std::string& session_id) const;

  std::string FinalDir(const std::string& session_id) const;
  std::string AssemblyLog(const std::string& session_id) const;
  // artifact is e.g. "vault.wav", "vault-raw.wav", "vault.mp3",
  // "assembly-manifest.json", "build-report.json".
  std::string FinalArtifact(const std::string& session_id, int assembly_number,
                            const std::string& artifact) const;

  // Path relative to root (for backup mirroring). Returns the input when it
  // does not live under root.
  std::string Relative(const std::string& path) const;

  static std::string ChunkTag(int chunk_index);        // "c03"
  static std::string CandidateFileName(int chunk_index, int version);  // "c03_v012.wav"

  // Version encoded in a candidate file name for chunk_index, including
  // leftover partial files ("c03_v012.wav.partial-..."). -1 if the name
  // does not belong to that chunk.
  static int ParseCandidateVersion(const std::string& file_name, int chunk_index);

  // Session ids become directory names: non-empty, no path separators,
  // not "." or "..".
  static bool IsValidSessionId(const std::string& session_id);

 private:
  std::string root_;
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_VAULT_LAYOUT_HPP_
