// Repository: NarroVault
// Component: Vault records
// Purpose: Record types persisted in the vault's append-only logs and the
//          session manifest, with their JSON forms.
// Copyright (c) 2026 NarroVault

#include "narrovault/vault/VaultRecords.hpp"

#include "narrovault/util/JsonLine.hpp"

namespace narrovault::vault {

using util::JsonObjectReader;
using util::JsonObjectWriter;

// -----------------------------------------------------------------------------
// LogRecord
// -----------------------------------------------------------------------------

std::string LogRecord::ToJsonLine() const {
  JsonObjectWriter w;
  w.AddUint("schema_version", schema_version)
      .AddUint("sequence", sequence)
      .Add("record_type", record_type)
      .Add("written_utc", written_utc)
      .AddRaw("payload", payload.empty() || payload.front() != '{' ? "{}" : payload);
  return w.str();
}

bool LogRecord::FromJsonLine(const std::string& line, LogRecord& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}') return false;
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(line, &r)) return false;
  uint64_t schema = 0;
  if (!r.GetUint64("schema_version", &schema)) return false;
  out.schema_version = static_cast<uint32_t>(schema);
  if (!r.GetUint64("sequence", &out.sequence)) return false;
  if (!r.GetString("record_type", &out.record_type)) return false;
  if (!r.GetString("written_utc", &out.written_utc)) return false;
  if (!r.GetRaw("payload", &out.payload)) return false;
  return true;
}

// -----------------------------------------------------------------------------
// CandidateRecord
// -----------------------------------------------------------------------------

std::string CandidateRecord::ToJson() const {
  JsonObjectWriter w;
  w.Add("session_id", session_id)
      .AddInt("chunk_index", chunk_index)
      .AddInt("version", version)
      .Add("audio_file", audio_file)
      .AddInt("sample_rate", sample_rate)
      .AddUint("sample_count", sample_count)
      .AddDouble("duration_seconds", duration_seconds)
      .AddDouble("composite_score", composite_score)
      .AddOptionalDouble("tonal_distance_to_prev", tonal_distance_to_prev)
      .AddBool("below_prefilter", below_prefilter)
      .Add("filter_reason", filter_reason)
      .Add("score_verdict", score_verdict)
      .AddDouble("flux_variance", flux_variance)
      .AddDouble("spectral_contrast", spectral_contrast)
      .AddDouble("spectral_flatness", spectral_flatness)
      .AddDouble("hf_ratio_db", hf_ratio_db)
      .AddDouble("clip_fraction", clip_fraction)
      .AddDouble("rms_dbfs", rms_dbfs)
      .AddInt("generated_at_ms", generated_at_ms)
      .Add("call_id", call_id)
      .AddInt("attempts", attempts);
  return w.str();
}

bool CandidateRecord::FromJson(const std::string& json, CandidateRecord& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  int64_t chunk = 0, version = 0;
  if (!r.GetString("session_id", &out.session_id)) return false;
  if (!r.GetInt64("chunk_index", &chunk)) return false;
  if (!r.GetInt64("version", &version)) return false;
  if (!r.GetString("audio_file", &out.audio_file)) return false;
  out.chunk_index = static_cast<int>(chunk);
  out.version = static_cast<int>(version);
  out.sample_rate = static_cast<int>(r.IntOr("sample_rate", 0));
  uint64_t count = 0;
  out.sample_count = r.GetUint64("sample_count", &count) ? count : 0;
  out.duration_seconds = r.DoubleOr("duration_seconds", 0.0);
  out.composite_score = r.DoubleOr("composite_score", 0.0);
  out.tonal_distance_to_prev = r.OptionalDouble("tonal_distance_to_prev");
  out.below_prefilter = r.BoolOr("below_prefilter", false);
  out.filter_reason = r.StringOr("filter_reason", "");
  out.score_verdict = r.StringOr("score_verdict", "");
  out.flux_variance = r.DoubleOr("flux_variance", 0.0);
  out.spectral_contrast = r.DoubleOr("spectral_contrast", 0.0);
  out.spectral_flatness = r.DoubleOr("spectral_flatness", 0.0);
  out.hf_ratio_db = r.DoubleOr("hf_ratio_db", 0.0);
  out.clip_fraction = r.DoubleOr("clip_fraction", 0.0);
  out.rms_dbfs = r.DoubleOr("rms_dbfs", 0.0);
  out.generated_at_ms = r.IntOr("generated_at_ms", 0);
  out.call_id = r.StringOr("call_id", "");
  out.attempts = static_cast<int>(r.IntOr("attempts", 0));
  return true;
}

// -----------------------------------------------------------------------------
// PickRecord
// -----------------------------------------------------------------------------

std::string PickRecord::ToJson() const {
  JsonObjectWriter w;
  w.AddInt("chunk_index", chunk_index)
      .AddInt("picked_version", picked_version)
      .Add("notes", notes)
      .AddInt("recorded_at_ms", recorded_at_ms);
  return w.str();
}

bool PickRecord::FromJson(const std::string& json, PickRecord& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  int64_t chunk = 0, version = 0;
  if (!r.GetInt64("chunk_index", &chunk)) return false;
  if (!r.GetInt64("picked_version", &version)) return false;
  out.chunk_index = static_cast<int>(chunk);
  out.picked_version = static_cast<int>(version);
  out.notes = r.StringOr("notes", "");
  out.recorded_at_ms = r.IntOr("recorded_at_ms", 0);
  return true;
}

// -----------------------------------------------------------------------------
// CallAttemptRecord
// -----------------------------------------------------------------------------

std::string CallAttemptRecord::ToJson() const {
  JsonObjectWriter w;
  w.Add("call_id", call_id)
      .Add("session_id", session_id)
      .AddInt("chunk_index", chunk_index)
      .AddInt("slot", slot)
      .AddInt("attempt", attempt)
      .Add("status", status)
      .AddInt("started_at_ms", started_at_ms)
      .AddInt("duration_ms", duration_ms)
      .AddInt("characters", characters)
      .AddInt("backoff_ms", backoff_ms)
      .Add("detail", detail);
  return w.str();
}

bool CallAttemptRecord::FromJson(const std::string& json, CallAttemptRecord& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  if (!r.GetString("call_id", &out.call_id)) return false;
  if (!r.GetString("status", &out.status)) return false;
  out.session_id = r.StringOr("session_id", "");
  out.chunk_index = static_cast<int>(r.IntOr("chunk_index", 0));
  out.slot = static_cast<int>(r.IntOr("slot", 0));
  out.attempt = static_cast<int>(r.IntOr("attempt", 0));
  out.started_at_ms = r.IntOr("started_at_ms", 0);
  out.duration_ms = r.IntOr("duration_ms", 0);
  out.characters = static_cast<int>(r.IntOr("characters", 0));
  out.backoff_ms = r.IntOr("backoff_ms", 0);
  out.detail = r.StringOr("detail", "");
  return true;
}

// -----------------------------------------------------------------------------
// StatusRecord
// -----------------------------------------------------------------------------

std::string StatusRecord::ToJson() const {
  JsonObjectWriter w;
  w.Add("from", from).Add("to", to).Add("reason", reason).AddBool("reopen", reopen)
      .AddInt("at_ms", at_ms);
  return w.str();
}

bool StatusRecord::FromJson(const std::string& json, StatusRecord& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  if (!r.GetString("to", &out.to)) return false;
  out.from = r.StringOr("from", "");
  out.reason = r.StringOr("reason", "");
  out.reopen = r.BoolOr("reopen", false);
  out.at_ms = r.IntOr("at_ms", 0);
  return true;
}

// -----------------------------------------------------------------------------
// GenerationLogEntry
// -----------------------------------------------------------------------------

std::string GenerationLogEntry::ToJson() const {
  std::vector<std::string> quoted;
  for (const auto& s : scripts) quoted.push_back("\"" + util::JsonEscape(s) + "\"");
  JsonObjectWriter w;
  w.Add("run_id", run_id)
      .AddInt("started_at_ms", started_at_ms)
      .AddInt("completed_at_ms", completed_at_ms)
      .AddRaw("scripts", util::JsonArray(quoted))
      .AddInt("scripts_processed", scripts_processed)
      .AddUint("total_api_calls", total_api_calls)
      .AddUint("attempted_characters", attempted_characters)
      .AddUint("billed_characters", billed_characters)
      .AddDouble("cost_estimate_usd", cost_estimate_usd)
      .AddUint("candidates_written", candidates_written)
      .AddUint("slots_failed", slots_failed)
      .AddUint("errors", errors)
      .AddUint("retries", retries)
      .AddUint("throttled", throttled)
      .AddBool("cancelled", cancelled)
      .AddBool("aborted", aborted)
      .AddBool("backup_complete", backup_complete);
  return w.str();
}

bool GenerationLogEntry::FromJson(const std::string& json, GenerationLogEntry& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  if (!r.GetString("run_id", &out.run_id)) return false;
  out.started_at_ms = r.IntOr("started_at_ms", 0);
  out.completed_at_ms = r.IntOr("completed_at_ms", 0);
  std::vector<std::string> raw;
  out.scripts.clear();
  if (r.GetArray("scripts", &raw)) {
    for (const auto& item : raw) {
      // Elements are JSON strings; strip the quotes via a one-member object.
      JsonObjectReader element;
      std::string value;
      if (JsonObjectReader::Parse("{\"v\":" + item + "}", &element) &&
          element.GetString("v", &value)) {
        out.scripts.push_back(value);
      }
    }
  }
  out.scripts_processed = static_cast<int>(r.IntOr("scripts_processed", 0));
  r.GetUint64("total_api_calls", &out.total_api_calls);
  r.GetUint64("attempted_characters", &out.attempted_characters);
  r.GetUint64("billed_characters", &out.billed_characters);
  out.cost_estimate_usd = r.DoubleOr("cost_estimate_usd", 0.0);
  r.GetUint64("candidates_written", &out.candidates_written);
  r.GetUint64("slots_failed", &out.slots_failed);
  r.GetUint64("errors", &out.errors);
  r.GetUint64("retries", &out.retries);
  r.GetUint64("throttled", &out.throttled);
  out.cancelled = r.BoolOr("cancelled", false);
  out.aborted = r.BoolOr("aborted", false);
  out.backup_complete = r.BoolOr("backup_complete", false);
  return true;
}

// -----------------------------------------------------------------------------
// AssemblyRecord
// -----------------------------------------------------------------------------

std::string AssemblyRecord::ToJson() const {
  std::vector<std::string> pick_items;
  for (const auto& p : picks) {
    JsonObjectWriter pw;
    pw.AddInt("chunk_index", p.first).AddInt("version", p.second);
    pick_items.push_back(pw.str());
  }
  std::vector<std::string> gates;
  for (const auto& g : failed_gates) gates.push_back("\"" + util::JsonEscape(g) + "\"");

  JsonObjectWriter w;
  w.AddInt("assembly_number", assembly_number)
      .AddRaw("picks", util::JsonArray(pick_items))
      .Add("final_wav", final_wav)
      .Add("raw_wav", raw_wav)
      .Add("mp3", mp3)
      .Add("manifest", manifest)
      .Add("report", report)
      .AddDouble("duration_seconds", duration_seconds)
      .AddDouble("integrated_lufs", integrated_lufs)
      .AddDouble("true_peak_dbtp", true_peak_dbtp)
      .AddBool("qa_passed", qa_passed)
      .AddRaw("failed_gates", util::JsonArray(gates))
      .AddInt("assembled_at_ms", assembled_at_ms);
  return w.str();
}

bool AssemblyRecord::FromJson(const std::string& json, AssemblyRecord& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  int64_t number = 0;
  if (!r.GetInt64("assembly_number", &number)) return false;
  out.assembly_number = static_cast<int>(number);
  out.picks.clear();
  std::vector<std::string> raw;
  if (r.GetArray("picks", &raw)) {
    for (const auto& item : raw) {
      JsonObjectReader pr;
      if (!JsonObjectReader::Parse(item, &pr)) continue;
      out.picks.emplace_back(static_cast<int>(pr.IntOr("chunk_index", 0)),
                             static_cast<int>(pr.IntOr("version", 0)));
    }
  }
  out.final_wav = r.StringOr("final_wav", "");
  out.raw_wav = r.StringOr("raw_wav", "");
  out.mp3 = r.StringOr("mp3", "");
  out.manifest = r.StringOr("manifest", "");
  out.report = r.StringOr("report", "");
  out.duration_seconds = r.DoubleOr("duration_seconds", 0.0);
  out.integrated_lufs = r.DoubleOr("integrated_lufs", 0.0);
  out.true_peak_dbtp = r.DoubleOr("true_peak_dbtp", 0.0);
  out.qa_passed = r.BoolOr("qa_passed", false);
  out.failed_gates.clear();
  if (r.GetArray("failed_gates", &raw)) {
    for (const auto& item : raw) {
      JsonObjectReader element;
      std::string value;
      if (JsonObjectReader::Parse("{\"v\":" + item + "}", &element) &&
          element.GetString("v", &value)) {
        out.failed_gates.push_back(value);
      }
    }
  }
  out.assembled_at_ms = r.IntOr("assembled_at_ms", 0);
  return true;
}

// -----------------------------------------------------------------------------
// SessionManifest
// -----------------------------------------------------------------------------

std::string SessionManifest::ToJson() const {
  JsonObjectWriter w;
  w.Add("session_id", session_id)
      .Add("script_id", script_id)
      .AddInt("total_chunks", total_chunks)
      .Add("category", category)
      .Add("emotion", emotion)
      .AddUint("total_candidates", total_candidates)
      .AddUint("candidates_below_prefilter", candidates_below_prefilter)
      .AddInt("chunks_below_prefilter", chunks_below_prefilter)
      .AddUint("total_api_calls", total_api_calls)
      .AddUint("total_characters_sent", total_characters_sent)
      .AddUint("billed_characters", billed_characters)
      .AddDouble("estimated_cost_usd", estimated_cost_usd)
      .AddDouble("generation_time_seconds", generation_time_seconds)
      .Add("status", status)
      .AddInt("picks_recorded", picks_recorded)
      .AddInt("last_assembly", last_assembly)
      .Add("updated_utc", updated_utc);
  return w.str();
}

bool SessionManifest::FromJson(const std::string& json, SessionManifest& out) {
  JsonObjectReader r;
  if (!JsonObjectReader::Parse(json, &r)) return false;
  if (!r.GetString("session_id", &out.session_id)) return false;
  if (!r.GetString("status", &out.status)) return false;
  out.script_id = r.StringOr("script_id", "");
  out.total_chunks = static_cast<int>(r.IntOr("total_chunks", 0));
  out.category = r.StringOr("category", "");
  out.emotion = r.StringOr("emotion", "");
  r.GetUint64("total_candidates", &out.total_candidates);
  r.GetUint64("candidates_below_prefilter", &out.candidates_below_prefilter);
  out.chunks_below_prefilter = static_cast<int>(r.IntOr("chunks_below_prefilter", 0));
  r.GetUint64("total_api_calls", &out.total_api_calls);
  r.GetUint64("total_characters_sent", &out.total_characters_sent);
  r.GetUint64("billed_characters", &out.billed_characters);
  out.estimated_cost_usd = r.DoubleOr("estimated_cost_usd", 0.0);
  out.generation_time_seconds = r.DoubleOr("generation_time_seconds", 0.0);
  out.picks_recorded = static_cast<int>(r.IntOr("picks_recorded", 0));
  out.last_assembly = static_cast<int>(r.IntOr("last_assembly", 0));
  out.updated_utc = r.StringOr("updated_utc", "");
  return true;
}

}  // namespace narrovault::vault
