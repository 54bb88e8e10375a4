// Repository: NarroVault
// Component: Vault Store
// Purpose: Durable, append-only storage of inventories, candidates, call
//          attempts, picks, status transitions and assemblies.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/VaultStore.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <sstream>

#include "narrovault/util/JsonLine.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/FileOps.hpp"

namespace narrovault::vault {

using narrovault::util::Logger;

namespace {

constexpr const char* kCandidateRecord = "CANDIDATE";
constexpr const char* kPickRecord = "PICK";
constexpr const char* kCallAttemptRecord = "CALL_ATTEMPT";
constexpr const char* kStatusRecord = "STATUS";
constexpr const char* kRunRecord = "RUN";
constexpr const char* kScriptRecord = "SCRIPT";
constexpr const char* kChunkRecord = "CHUNK";
constexpr const char* kAssemblyRecord = "ASSEMBLY";

std::string ScriptHeaderJson(const inventory::ScriptInventory& inv) {
  util::JsonObjectWriter w;
  w.Add("script_id", inv.script_id())
      .AddInt("total_chunks", inv.size())
      .Add("category", inv.category())
      .Add("emotion", inv.emotion());
  return w.str();
}

}  // namespace

VaultStore::VaultStore(VaultStoreConfig config, std::shared_ptr<ITimeSource> time_source)
    : config_(std::move(config)),
      layout_(config_.root),
      time_source_(time_source ? std::move(time_source) : std::make_shared<SystemTimeSource>()) {
  if (config_.root.empty()) throw VaultError("VaultStore: empty vault root");
  MakeDirs(layout_.root());
  writer_ = std::make_unique<LogWriter>(time_source_);
  std::ostringstream msg;
  msg << "[VaultStore] OPENED root=" << layout_.root()
      << " prefilter_threshold=" << config_.prefilter_threshold;
  Logger::Info(msg.str());
}

VaultStore::~VaultStore() = default;

void VaultStore::RequireSession(const std::string& session_id) const {
  if (!VaultLayout::IsValidSessionId(session_id)) {
    throw VaultError("VaultStore: invalid session id '" + session_id + "'");
  }
}

// -----------------------------------------------------------------------------
// Sessions
// -----------------------------------------------------------------------------

void VaultStore::EnsureSessionLayout(const std::string& session_id) {
  RequireSession(session_id);
  MakeDirs(layout_.SessionDir(session_id));
  MakeDirs(layout_.PicksDir(session_id));
  MakeDirs(layout_.FinalDir(session_id));
}

bool VaultStore::SessionExists(const std::string& session_id) const {
  return VaultLayout::IsValidSessionId(session_id) &&
         FileExists(layout_.SessionDir(session_id));
}

// -----------------------------------------------------------------------------
// Inventory
// -----------------------------------------------------------------------------

int VaultStore::RecordInventory(const inventory::ScriptInventory& inv) {
  std::map<int, std::string> latest_chunks;
  std::string latest_header;
  for (const auto& rec : AppendLog::ReplayFile(layout_.InventoryLog())) {
    util::JsonObjectReader r;
    if (!util::JsonObjectReader::Parse(rec.payload, &r)) continue;
    if (r.StringOr("script_id", "") != inv.script_id()) continue;
    if (rec.record_type == kScriptRecord) {
      latest_header = rec.payload;
    } else if (rec.record_type == kChunkRecord) {
      latest_chunks[static_cast<int>(r.IntOr("chunk_index", -1))] = rec.payload;
    }
  }

  const std::string header = ScriptHeaderJson(inv);
  if (header != latest_header) {
    writer_->AppendDurable(layout_.InventoryLog(), kScriptRecord, header);
  }
  int appended = 0;
  for (const auto& chunk : inv.chunks()) {
    const std::string json = chunk.ToJson();
    auto it = latest_chunks.find(chunk.chunk_index);
    if (it != latest_chunks.end() && it->second == json) continue;
    writer_->AppendDurable(layout_.InventoryLog(), kChunkRecord, json);
    ++appended;
  }
  if (appended > 0 || header != latest_header) NoteWritten(layout_.InventoryLog());

  std::ostringstream msg;
  msg << "[VaultStore] INVENTORY_RECORDED script=" << inv.script_id()
      << " chunks=" << inv.size() << " revised=" << appended;
  Logger::Info(msg.str());
  return appended;
}

std::optional<inventory::ScriptInventory> VaultStore::LoadInventory(
    const std::string& script_id) const {
  int total = -1;
  std::map<int, inventory::Chunk> latest;
  for (const auto& rec : AppendLog::ReplayFile(layout_.InventoryLog())) {
    util::JsonObjectReader r;
    if (!util::JsonObjectReader::Parse(rec.payload, &r)) continue;
    if (r.StringOr("script_id", "") != script_id) continue;
    if (rec.record_type == kScriptRecord) {
      total = static_cast<int>(r.IntOr("total_chunks", 0));
    } else if (rec.record_type == kChunkRecord) {
      inventory::Chunk chunk;
      if (inventory::Chunk::FromJson(rec.payload, chunk)) latest[chunk.chunk_index] = chunk;
    }
  }
  if (total < 0) return std::nullopt;

  std::vector<inventory::Chunk> chunks;
  for (auto& [index, chunk] : latest) {
    if (index >= 0 && index < total) chunks.push_back(chunk);
  }
  return inventory::ScriptInventory::FromChunks(script_id, std::move(chunks));
}

// -----------------------------------------------------------------------------
// Candidates
// -----------------------------------------------------------------------------

VaultStore::ChunkState& VaultStore::LoadChunkLocked(const std::string& session_id,
                                                    int chunk_index) const {
  auto key = std::make_pair(session_id, chunk_index);
  auto it = chunks_.find(key);
  if (it != chunks_.end()) return it->second;

  ChunkState state;
  std::set<int> seen;
  for (const auto& rec : AppendLog::ReplayFile(layout_.CandidateMetaLog(session_id, chunk_index))) {
    if (rec.record_type != kCandidateRecord) continue;
    CandidateRecord cand;
    if (!CandidateRecord::FromJson(rec.payload, cand)) continue;
    if (!seen.insert(cand.version).second) {
      Logger::Error("[VaultStore] DUPLICATE_VERSION session=" + session_id +
                    " chunk=" + std::to_string(chunk_index) +
                    " version=" + std::to_string(cand.version));
      continue;
    }
    state.next_version = std::max(state.next_version, cand.version + 1);
    state.records.push_back(std::move(cand));
  }
  // Files without a metadata record (crash between publish and append, or a
  // leftover partial) still hold their version.
  for (const auto& name : ListDir(layout_.ChunkDir(session_id, chunk_index))) {
    int v = VaultLayout::ParseCandidateVersion(name, chunk_index);
    if (v >= 0) state.next_version = std::max(state.next_version, v + 1);
  }
  std::sort(state.records.begin(), state.records.end(),
            [](const CandidateRecord& a, const CandidateRecord& b) { return a.version < b.version; });
  return chunks_.emplace(key, std::move(state)).first->second;
}

CandidateRecord VaultStore::WriteCandidate(const std::string& session_id,
                                           const CandidateDraft& draft) {
  RequireSession(session_id);
  const ErrorContext ctx{session_id, draft.chunk_index, "WRITE_CANDIDATE"};
  if (draft.audio.empty()) throw VaultError("VaultStore: empty candidate audio", ctx);

  int version = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    version = LoadChunkLocked(session_id, draft.chunk_index).next_version++;
  }

  MakeDirs(layout_.ChunkDir(session_id, draft.chunk_index));
  const std::string final_path = layout_.CandidateAudio(session_id, draft.chunk_index, version);
  const std::string partial = PartialPathFor(final_path);

  std::string error;
  audio::EncodeSettings settings;
  settings.container = audio::AudioContainer::kWavPcm16;
  if (!encoder_.WriteFile(draft.audio, partial, settings, &error)) {
    ::unlink(partial.c_str());
    throw VaultError("VaultStore: candidate encode failed: " + error, ctx);
  }
  SyncPath(partial);
  PublishNoReplace(partial, final_path);

  CandidateRecord rec;
  rec.session_id = session_id;
  rec.chunk_index = draft.chunk_index;
  rec.version = version;
  rec.audio_file = VaultLayout::ChunkTag(draft.chunk_index) + "/" +
                   VaultLayout::CandidateFileName(draft.chunk_index, version);
  rec.sample_rate = draft.audio.sample_rate;
  rec.sample_count = draft.audio.samples.size();
  rec.duration_seconds = draft.audio.DurationSeconds();
  rec.composite_score = draft.score.composite;
  rec.tonal_distance_to_prev = draft.tonal_distance_to_prev;
  const bool low_score = IsBelowPrefilter(draft.score.composite, config_.prefilter_threshold);
  rec.below_prefilter = low_score || draft.overgenerated;
  rec.filter_reason = draft.overgenerated ? "overgenerated" : (low_score ? "score" : "");
  rec.score_verdict = scoring::ScoreVerdictToString(draft.score.verdict);
  const auto& f = draft.score.features;
  rec.flux_variance = f.flux_variance;
  rec.spectral_contrast = f.spectral_contrast;
  rec.spectral_flatness = f.spectral_flatness;
  rec.hf_ratio_db = f.hf_ratio_db;
  rec.clip_fraction = f.clip_fraction;
  rec.rms_dbfs = f.rms_dbfs;
  rec.generated_at_ms = time_source_->NowUtcMs();
  rec.call_id = draft.call_id;
  rec.attempts = draft.attempts;

  const std::string meta_log = layout_.CandidateMetaLog(session_id, draft.chunk_index);
  writer_->AppendDurable(meta_log, kCandidateRecord, rec.ToJson());

  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = LoadChunkLocked(session_id, draft.chunk_index);
    auto pos = std::upper_bound(
        state.records.begin(), state.records.end(), rec,
        [](const CandidateRecord& a, const CandidateRecord& b) { return a.version < b.version; });
    state.records.insert(pos, rec);
  }
  NoteWritten(final_path);
  NoteWritten(meta_log);

  std::ostringstream msg;
  msg << "[VaultStore] CANDIDATE_COMMITTED session=" << session_id
      << " chunk=" << draft.chunk_index << " version=" << version
      << " score=" << rec.composite_score
      << " below_prefilter=" << (rec.below_prefilter ? "true" : "false");
  if (!rec.filter_reason.empty()) msg << " reason=" << rec.filter_reason;
  Logger::Info(msg.str());
  return rec;
}

std::vector<CandidateRecord> VaultStore::ListCandidates(const std::string& session_id,
                                                        int chunk_index,
                                                        bool include_below_prefilter) const {
  RequireSession(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& state = LoadChunkLocked(session_id, chunk_index);
  std::vector<CandidateRecord> out;
  for (const auto& rec : state.records) {
    if (!include_below_prefilter && rec.below_prefilter) continue;
    out.push_back(rec);
  }
  return out;
}

std::optional<CandidateRecord> VaultStore::FindCandidate(const std::string& session_id,
                                                         int chunk_index, int version) const {
  RequireSession(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& rec : LoadChunkLocked(session_id, chunk_index).records) {
    if (rec.version == version) return rec;
  }
  return std::nullopt;
}

std::optional<CandidateRecord> VaultStore::BestCandidate(const std::string& session_id,
                                                         int chunk_index) const {
  RequireSession(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  const CandidateRecord* best = nullptr;
  for (const auto& rec : LoadChunkLocked(session_id, chunk_index).records) {
    if (!best) {
      best = &rec;
      continue;
    }
    // Unflagged beats flagged, then score; records are in version order so
    // strict comparison keeps the lower version on ties.
    if (best->below_prefilter && !rec.below_prefilter) {
      best = &rec;
    } else if (best->below_prefilter == rec.below_prefilter &&
               rec.composite_score > best->composite_score) {
      best = &rec;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

int VaultStore::PeekNextVersion(const std::string& session_id, int chunk_index) const {
  RequireSession(session_id);
  std::lock_guard<std::mutex> lock(mutex_);
  return LoadChunkLocked(session_id, chunk_index).next_version;
}

std::string VaultStore::CandidatePath(const CandidateRecord& record) const {
  return layout_.SessionDir(record.session_id) + "/" + record.audio_file;
}

// -----------------------------------------------------------------------------
// Call attempts
// -----------------------------------------------------------------------------

uint64_t VaultStore::AppendCallAttempt(const CallAttemptRecord& attempt) {
  RequireSession(attempt.session_id);
  const std::string path = layout_.CallLog(attempt.session_id);
  uint64_t seq = writer_->AppendDurable(path, kCallAttemptRecord, attempt.ToJson());
  NoteWritten(path);
  return seq;
}

std::vector<CallAttemptRecord> VaultStore::CallAttempts(const std::string& session_id) const {
  RequireSession(session_id);
  std::vector<CallAttemptRecord> out;
  for (const auto& rec : AppendLog::ReplayFile(layout_.CallLog(session_id))) {
    if (rec.record_type != kCallAttemptRecord) continue;
    CallAttemptRecord attempt;
    if (CallAttemptRecord::FromJson(rec.payload, attempt)) out.push_back(std::move(attempt));
  }
  return out;
}

// -----------------------------------------------------------------------------
// Picks
// -----------------------------------------------------------------------------

void VaultStore::RecordPick(const std::string& session_id, const PickRecord& pick) {
  RequireSession(session_id);
  if (!FindCandidate(session_id, pick.chunk_index, pick.picked_version)) {
    throw VaultError("VaultStore: pick references no committed candidate (version " +
                         std::to_string(pick.picked_version) + ")",
                     ErrorContext{session_id, pick.chunk_index, "RECORD_PICK"});
  }
  MakeDirs(layout_.PicksDir(session_id));
  PickRecord stamped = pick;
  if (stamped.recorded_at_ms == 0) stamped.recorded_at_ms = time_source_->NowUtcMs();
  const std::string path = layout_.PickLog(session_id);
  writer_->AppendDurable(path, kPickRecord, stamped.ToJson());
  NoteWritten(path);

  std::ostringstream msg;
  msg << "[VaultStore] PICK_RECORDED session=" << session_id << " chunk=" << pick.chunk_index
      << " version=" << pick.picked_version;
  Logger::Info(msg.str());
}

std::map<int, PickRecord> VaultStore::ActivePicks(const std::string& session_id) const {
  RequireSession(session_id);
  std::map<int, PickRecord> active;
  for (const auto& rec : AppendLog::ReplayFile(layout_.PickLog(session_id))) {
    if (rec.record_type != kPickRecord) continue;
    PickRecord pick;
    if (PickRecord::FromJson(rec.payload, pick)) active[pick.chunk_index] = pick;
  }
  return active;
}

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------

void VaultStore::AppendStatus(const std::string& session_id, const StatusRecord& status) {
  RequireSession(session_id);
  MakeDirs(layout_.SessionDir(session_id));
  const std::string path = layout_.StatusLog(session_id);
  writer_->AppendDurable(path, kStatusRecord, status.ToJson());
  NoteWritten(path);
}

std::vector<StatusRecord> VaultStore::StatusHistory(const std::string& session_id) const {
  RequireSession(session_id);
  std::vector<StatusRecord> out;
  for (const auto& rec : AppendLog::ReplayFile(layout_.StatusLog(session_id))) {
    if (rec.record_type != kStatusRecord) continue;
    StatusRecord status;
    if (StatusRecord::FromJson(rec.payload, status)) out.push_back(std::move(status));
  }
  return out;
}

// -----------------------------------------------------------------------------
// Generation runs
// -----------------------------------------------------------------------------

void VaultStore::AppendGenerationLog(const GenerationLogEntry& entry) {
  writer_->AppendDurable(layout_.GenerationLog(), kRunRecord, entry.ToJson());
  NoteWritten(layout_.GenerationLog());
}

std::vector<GenerationLogEntry> VaultStore::GenerationLog() const {
  std::vector<GenerationLogEntry> out;
  for (const auto& rec : AppendLog::ReplayFile(layout_.GenerationLog())) {
    if (rec.record_type != kRunRecord) continue;
    GenerationLogEntry entry;
    if (GenerationLogEntry::FromJson(rec.payload, entry)) out.push_back(std::move(entry));
  }
  return out;
}

// -----------------------------------------------------------------------------
// Assemblies
// -----------------------------------------------------------------------------

int VaultStore::NextAssemblyNumber(const std::string& session_id) const {
  RequireSession(session_id);
  int max_number = 0;
  for (const auto& rec : Assemblies(session_id)) {
    max_number = std::max(max_number, rec.assembly_number);
  }
  // Artifacts of an attempt that died before its record still hold the number.
  const std::string prefix = session_id + "-a";
  for (const auto& name : ListDir(layout_.FinalDir(session_id))) {
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    size_t pos = prefix.size();
    size_t end = pos;
    while (end < name.size() && std::isdigit(static_cast<unsigned char>(name[end]))) ++end;
    if (end == pos || end - pos > 9 || end >= name.size() || name[end] != '-') continue;
    max_number = std::max(max_number, std::stoi(name.substr(pos, end - pos)));
  }
  return max_number + 1;
}

void VaultStore::AppendAssembly(const std::string& session_id, const AssemblyRecord& record) {
  RequireSession(session_id);
  MakeDirs(layout_.FinalDir(session_id));
  const std::string path = layout_.AssemblyLog(session_id);
  writer_->AppendDurable(path, kAssemblyRecord, record.ToJson());
  NoteWritten(path);
}

std::vector<AssemblyRecord> VaultStore::Assemblies(const std::string& session_id) const {
  RequireSession(session_id);
  std::vector<AssemblyRecord> out;
  for (const auto& rec : AppendLog::ReplayFile(layout_.AssemblyLog(session_id))) {
    if (rec.record_type != kAssemblyRecord) continue;
    AssemblyRecord assembly;
    if (AssemblyRecord::FromJson(rec.payload, assembly)) out.push_back(std::move(assembly));
  }
  return out;
}

// -----------------------------------------------------------------------------
// Manifest
// -----------------------------------------------------------------------------

void VaultStore::WriteManifest(const SessionManifest& manifest) {
  RequireSession(manifest.session_id);
  MakeDirs(layout_.SessionDir(manifest.session_id));
  const std::string path = layout_.SessionManifest(manifest.session_id);
  WriteFileAtomic(path, manifest.ToJson() + "\n");
  NoteWritten(path);
}

std::optional<SessionManifest> VaultStore::ReadManifest(const std::string& session_id) const {
  RequireSession(session_id);
  std::string content;
  if (!ReadFileToString(layout_.SessionManifest(session_id), &content)) return std::nullopt;
  while (!content.empty() && (content.back() == '\n' || content.back() == '\r')) content.pop_back();
  SessionManifest manifest;
  if (!SessionManifest::FromJson(content, manifest)) {
    throw VaultError("VaultStore: corrupt session manifest",
                     ErrorContext{session_id, -1, "READ_MANIFEST"});
  }
  return manifest;
}

// -----------------------------------------------------------------------------
// Backup bookkeeping
// -----------------------------------------------------------------------------

void VaultStore::NoteWritten(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (written_seen_.insert(path).second) written_paths_.push_back(path);
}

std::vector<std::string> VaultStore::TakeWrittenPaths() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.swap(written_paths_);
  written_seen_.clear();
  return out;
}

}  // namespace narrovault::vault
