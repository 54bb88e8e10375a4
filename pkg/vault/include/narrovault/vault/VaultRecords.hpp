// Repository: NarroVault
// Component: Vault records
// Purpose: Record types persisted in the vault's append-only logs and the
//          session manifest, with their JSON forms.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_VAULT_VAULT_RECORDS_HPP_
#define NARROVAULT_VAULT_VAULT_RECORDS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace narrovault::vault {

// Envelope for every log line.
struct LogRecord {
  static constexpr uint32_t kSchemaVersion = 1u;

  uint32_t schema_version = kSchemaVersion;
  uint64_t sequence = 0;
  std::string record_type;  // CANDIDATE, PICK, CALL_ATTEMPT, STATUS, RUN, CHUNK, ASSEMBLY
  std::string written_utc;
  std::string payload;      // JSON object

  // Serialize to single-line JSON (one line of JSONL).
  std::string ToJsonLine() const;
  // Parse from single line; returns false if line is corrupt/incomplete.
  static bool FromJsonLine(const std::string& line, LogRecord& out);
};

// One synthesized attempt for a chunk. Immutable once committed.
struct CandidateRecord {
  std::string session_id;
  int chunk_index = 0;
  int version = 0;
  std::string audio_file;  // relative to the session directory
  int sample_rate = 0;
  uint64_t sample_count = 0;
  double duration_seconds = 0.0;

  double composite_score = 0.0;
  // Absent for chunk 0 and whenever no previous-chunk reference existed.
  std::optional<double> tonal_distance_to_prev;
  bool below_prefilter = false;
  std::string filter_reason;  // "", "score", "overgenerated"
  std::string score_verdict;

  double flux_variance = 0.0;
  double spectral_contrast = 0.0;
  double spectral_flatness = 0.0;
  double hf_ratio_db = 0.0;
  double clip_fraction = 0.0;
  double rms_dbfs = 0.0;

  int64_t generated_at_ms = 0;
  std::string call_id;
  int attempts = 0;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, CandidateRecord& out);
};

struct PickRecord {
  int chunk_index = 0;
  int picked_version = 0;
  std::string notes;
  int64_t recorded_at_ms = 0;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, PickRecord& out);
};

// One external call attempt. Written before any vault write for that attempt.
struct CallAttemptRecord {
  std::string call_id;
  std::string session_id;
  int chunk_index = 0;
  int slot = 0;
  int attempt = 0;
  std::string status;
  int64_t started_at_ms = 0;
  int64_t duration_ms = 0;
  int characters = 0;
  int64_t backoff_ms = 0;  // delay waited before this attempt
  std::string detail;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, CallAttemptRecord& out);
};

// Session status transition.
struct StatusRecord {
  std::string from;
  std::string to;
  std::string reason;
  bool reopen = false;
  int64_t at_ms = 0;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, StatusRecord& out);
};

// One orchestrator run, appended to the global generation log.
struct GenerationLogEntry {
  std::string run_id;
  int64_t started_at_ms = 0;
  int64_t completed_at_ms = 0;
  std::vector<std::string> scripts;
  int scripts_processed = 0;
  uint64_t total_api_calls = 0;
  uint64_t attempted_characters = 0;
  uint64_t billed_characters = 0;
  double cost_estimate_usd = 0.0;
  uint64_t candidates_written = 0;
  uint64_t slots_failed = 0;
  uint64_t errors = 0;
  uint64_t retries = 0;
  uint64_t throttled = 0;
  bool cancelled = false;
  bool aborted = false;  // stopped by a structural failure
  bool backup_complete = false;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, GenerationLogEntry& out);
};

// One assembly attempt for a session.
struct AssemblyRecord {
  int assembly_number = 0;
  std::vector<std::pair<int, int>> picks;  // (chunk_index, version)
  std::string final_wav;
  std::string raw_wav;
  std::string mp3;
  std::string manifest;
  std::string report;
  double duration_seconds = 0.0;
  double integrated_lufs = 0.0;
  double true_peak_dbtp = 0.0;
  bool qa_passed = false;
  std::vector<std::string> failed_gates;
  int64_t assembled_at_ms = 0;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, AssemblyRecord& out);
};

// Snapshot recomputed after every run; replaced atomically.
struct SessionManifest {
  std::string session_id;
  std::string script_id;
  int total_chunks = 0;
  std::string category;
  std::string emotion;
  uint64_t total_candidates = 0;
  uint64_t candidates_below_prefilter = 0;
  int chunks_below_prefilter = 0;  // chunks with no candidate above threshold
  uint64_t total_api_calls = 0;
  uint64_t total_characters_sent = 0;
  uint64_t billed_characters = 0;
  double estimated_cost_usd = 0.0;
  double generation_time_seconds = 0.0;
  std::string status;
  int picks_recorded = 0;
  int last_assembly = 0;
  std::string updated_utc;

  std::string ToJson() const;
  static bool FromJson(const std::string& json, SessionManifest& out);
};

}  // namespace narrovault::vault

#endif  // NARROVAULT_VAULT_VAULT_RECORDS_HPP_
