// Repository: NarroVault
// Component: Assembly Engine
// Purpose: Deterministic mixdown of one picked candidate per chunk into the
//          session's final artifacts, followed by the QA gate battery.
// Copyright (c) 2026 NarroVault

#include "narrovault/assembly/AssemblyEngine.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <sstream>

#include "narrovault/audio/PeakLimiter.hpp"
#include "narrovault/util/JsonLine.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/TimeFormat.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/FileOps.hpp"

namespace narrovault::assembly {

using narrovault::util::Logger;

namespace {

constexpr double kPi = 3.14159265358979323846;

ErrorContext StageContext(const std::string& session_id, AssemblyStage stage,
                          int chunk_index = -1) {
  return ErrorContext{session_id, chunk_index, AssemblyStageToString(stage)};
}

std::string Fixed(double v, int precision = 2) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(precision);
  oss << v;
  return oss.str();
}

}  // namespace

const char* AssemblyStageToString(AssemblyStage stage) {
  switch (stage) {
    case AssemblyStage::kNotStarted: return "NOT_STARTED";
    case AssemblyStage::kPicksLoaded: return "PICKS_LOADED";
    case AssemblyStage::kFaded: return "FADED";
    case AssemblyStage::kSilenceInserted: return "SILENCE_INSERTED";
    case AssemblyStage::kConcatenated: return "CONCATENATED";
    case AssemblyStage::kNormalized: return "NORMALIZED";
    case AssemblyStage::kEncoded: return "ENCODED";
    case AssemblyStage::kQaChecked: return "QA_CHECKED";
  }
  return "UNKNOWN";
}

const char* SegmentKindToString(SegmentKind kind) {
  switch (kind) {
    case SegmentKind::kSpeech: return "speech";
    case SegmentKind::kSilence: return "silence";
  }
  return "unknown";
}

void ApplyEdgeFades(audio::PcmBuffer& pcm, size_t fade_samples) {
  const size_t n = std::min(fade_samples, pcm.size() / 2);
  if (n == 0) return;
  auto& s = pcm.samples;
  const size_t total = s.size();
  for (size_t i = 0; i < n; ++i) {
    // Half-sine curve: (1 - cos(pi * x)) / 2 for x in [0, 1).
    const double x = static_cast<double>(i) / static_cast<double>(n);
    const float gain = static_cast<float>((1.0 - std::cos(kPi * x)) / 2.0);
    s[i] *= gain;
    s[total - 1 - i] *= gain;
  }
}

AssemblyEngine::AssemblyEngine(AssemblyConfig config, vault::VaultStore& store,
                               std::shared_ptr<IPauseHumanizer> humanizer, QaConfig qa_config)
    : config_(config), store_(store), humanizer_(std::move(humanizer)), qa_(qa_config) {}

// =============================================================================
// Assemble
// =============================================================================

AssemblyResult AssemblyEngine::Assemble(const AssemblyInput& input) {
  stage_ = AssemblyStage::kNotStarted;
  AssemblyResult result;
  const std::string& session = input.session_id;

  Logger::Info("[AssemblyEngine] ASSEMBLY_START session=" + session +
               " chunks=" + std::to_string(input.inventory.size()));

  std::vector<PickedChunk> chunks = LoadPicks(input);
  stage_ = AssemblyStage::kPicksLoaded;

  FadeChunks(chunks);
  stage_ = AssemblyStage::kFaded;

  result.pauses_s = ResolvePauses(session, chunks);
  stage_ = AssemblyStage::kSilenceInserted;

  audio::PcmBuffer raw = Concatenate(chunks, result.pauses_s, &result.timeline);
  stage_ = AssemblyStage::kConcatenated;

  audio::PcmBuffer final_pcm = Normalize(session, raw, &result);
  stage_ = AssemblyStage::kNormalized;

  Encode(session, raw, final_pcm, &result);
  stage_ = AssemblyStage::kEncoded;

  std::map<int, int> chunk_characters;
  for (const auto& chunk : input.inventory.chunks()) {
    chunk_characters[chunk.chunk_index] = chunk.char_count;
  }
  QaInput qa_input;
  qa_input.final_wav_path =
      store_.layout().FinalArtifact(session, result.assembly_number, "vault.wav");
  qa_input.raw = &raw;
  qa_input.timeline = &result.timeline;
  qa_input.target_lufs = config_.target_lufs;
  qa_input.true_peak_ceiling_dbtp = config_.true_peak_ceiling_dbtp;
  qa_input.target_duration_s = input.target_duration_s;
  qa_input.chunk_characters = &chunk_characters;
  result.qa = qa_.Run(qa_input);
  stage_ = AssemblyStage::kQaChecked;
  result.stage = stage_;

  auto& rec = result.record;
  rec.assembly_number = result.assembly_number;
  for (const auto& c : chunks) rec.picks.emplace_back(c.chunk.chunk_index, c.candidate.version);
  rec.duration_seconds = final_pcm.DurationSeconds();
  rec.integrated_lufs = result.qa.final_loudness.integrated_lufs;
  rec.true_peak_dbtp = result.qa.final_loudness.true_peak_dbtp;
  rec.qa_passed = result.qa.passed;
  rec.failed_gates = result.qa.FailedGates();
  rec.assembled_at_ms = store_.time_source().NowUtcMs();

  const std::string report_path =
      store_.layout().FinalArtifact(session, result.assembly_number, "build-report.json");
  PublishText(session, ReportJson(session, input, result), report_path);
  rec.report = "final/" + vault::BaseName(report_path);
  store_.AppendAssembly(session, rec);

  std::ostringstream done;
  done << "[AssemblyEngine] ASSEMBLY_COMPLETE session=" << session
       << " assembly=" << result.assembly_number
       << " duration_s=" << Fixed(rec.duration_seconds, 3)
       << " integrated_lufs=" << Fixed(rec.integrated_lufs)
       << " true_peak_dbtp=" << Fixed(rec.true_peak_dbtp)
       << " qa=" << (rec.qa_passed ? "PASS" : "FAIL");
  Logger::Info(done.str());

  if (!result.qa.passed) throw QaGateFailure(session, rec.failed_gates);
  return result;
}

// =============================================================================
// Stages
// =============================================================================

std::vector<AssemblyEngine::PickedChunk> AssemblyEngine::LoadPicks(const AssemblyInput& input) {
  const std::string& session = input.session_id;
  if (input.inventory.empty()) {
    throw AssemblyError("AssemblyEngine: empty inventory",
                        StageContext(session, AssemblyStage::kPicksLoaded));
  }

  std::vector<int> missing;
  for (const auto& chunk : input.inventory.chunks()) {
    if (input.picks.find(chunk.chunk_index) == input.picks.end()) {
      missing.push_back(chunk.chunk_index);
    }
  }
  if (!missing.empty()) {
    Logger::Error("[AssemblyEngine] INCOMPLETE_PICKS session=" + session +
                  " missing=" + std::to_string(missing.size()));
    throw IncompletePicksError(session, missing);
  }

  std::vector<PickedChunk> out;
  out.reserve(static_cast<size_t>(input.inventory.size()));
  // Inventory order is chunk_index ascending.
  for (const auto& chunk : input.inventory.chunks()) {
    const auto& pick = input.picks.at(chunk.chunk_index);
    const auto ctx = StageContext(session, AssemblyStage::kPicksLoaded, chunk.chunk_index);
    auto candidate = store_.FindCandidate(session, chunk.chunk_index, pick.picked_version);
    if (!candidate) {
      throw AssemblyError("AssemblyEngine: picked version " +
                              std::to_string(pick.picked_version) + " is not committed",
                          ctx);
    }

    PickedChunk picked;
    picked.chunk = chunk;
    picked.candidate = *candidate;
    std::string error;
    if (!decoder_.DecodeFile(store_.CandidatePath(*candidate), &picked.audio, &error)) {
      throw AssemblyError("AssemblyEngine: cannot decode picked candidate: " + error, ctx);
    }
    if (picked.audio.empty()) {
      throw AssemblyError("AssemblyEngine: picked candidate has no audio", ctx);
    }
    out.push_back(std::move(picked));
  }
  return out;
}

void AssemblyEngine::FadeChunks(std::vector<PickedChunk>& chunks) const {
  for (auto& c : chunks) {
    ApplyEdgeFades(c.audio,
                   audio::PcmBuffer::SamplesFor(config_.fade_ms / 1000.0, c.audio.sample_rate));
  }
}

std::vector<double> AssemblyEngine::ResolvePauses(const std::string& session_id,
                                                  const std::vector<PickedChunk>& chunks) const {
  std::shared_ptr<IPauseHumanizer> humanizer = humanizer_;
  if (!humanizer) {
    if (config_.humanize_pauses) {
      humanizer = std::make_shared<JitterPauseHumanizer>(session_id);
    } else {
      humanizer = std::make_shared<IdentityPauseHumanizer>();
    }
  }
  std::vector<double> pauses;
  pauses.reserve(chunks.size());
  for (const auto& c : chunks) {
    const double p = humanizer->PauseAfter(c.chunk);
    if (!std::isfinite(p) || p < 0.0) {
      throw AssemblyError("AssemblyEngine: humanizer returned invalid pause " + Fixed(p, 3),
                          StageContext(session_id, AssemblyStage::kSilenceInserted,
                                       c.chunk.chunk_index));
    }
    pauses.push_back(p);
  }
  return pauses;
}

audio::PcmBuffer AssemblyEngine::Concatenate(const std::vector<PickedChunk>& chunks,
                                             const std::vector<double>& pauses,
                                             Timeline* timeline) const {
  audio::PcmBuffer out;
  out.sample_rate = audio::kVaultSampleRate;
  size_t total = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    total += chunks[i].audio.size() + audio::PcmBuffer::SamplesFor(pauses[i], out.sample_rate);
  }
  out.samples.reserve(total);

  const double rate = static_cast<double>(out.sample_rate);
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& c = chunks[i];
    TimelineSegment speech;
    speech.kind = SegmentKind::kSpeech;
    speech.chunk_index = c.chunk.chunk_index;
    speech.version = c.candidate.version;
    speech.start_sample = out.samples.size();
    out.samples.insert(out.samples.end(), c.audio.samples.begin(), c.audio.samples.end());
    speech.end_sample = out.samples.size();
    speech.start_s = static_cast<double>(speech.start_sample) / rate;
    speech.end_s = static_cast<double>(speech.end_sample) / rate;
    timeline->push_back(speech);

    const size_t gap = audio::PcmBuffer::SamplesFor(pauses[i], out.sample_rate);
    if (gap == 0) continue;
    TimelineSegment silence;
    silence.kind = SegmentKind::kSilence;
    silence.chunk_index = c.chunk.chunk_index;
    silence.start_sample = out.samples.size();
    out.samples.insert(out.samples.end(), gap, 0.0f);
    silence.end_sample = out.samples.size();
    silence.start_s = static_cast<double>(silence.start_sample) / rate;
    silence.end_s = static_cast<double>(silence.end_sample) / rate;
    timeline->push_back(silence);
  }
  return out;
}

audio::PcmBuffer AssemblyEngine::Normalize(const std::string& session_id,
                                           const audio::PcmBuffer& raw,
                                           AssemblyResult* result) const {
  result->raw_loudness = audio::MeasureLoudness(raw);
  const auto& m = result->raw_loudness;
  if (!std::isfinite(m.integrated_lufs)) {
    throw AssemblyError("AssemblyEngine: concatenation is silent, cannot normalize",
                        StageContext(session_id, AssemblyStage::kNormalized));
  }

  audio::PeakLimiterConfig limiter;
  limiter.ceiling_dbtp = config_.true_peak_ceiling_dbtp;
  audio::NormalizationReport norm;
  audio::PcmBuffer out = audio::NormalizeLoudness(raw, config_.target_lufs, limiter, &norm);

  result->applied_gain_db = norm.applied_gain_db;
  result->peak_limited = norm.limiter.engaged;
  result->limiter_reduction_db = norm.limiter.max_reduction_db;
  result->lra_above_target = m.loudness_range_lu > config_.target_lra_lu;

  std::ostringstream msg;
  msg << "[AssemblyEngine] NORMALIZE session=" << session_id
      << " measured_lufs=" << Fixed(m.integrated_lufs)
      << " true_peak_dbtp=" << Fixed(m.true_peak_dbtp)
      << " lra_lu=" << Fixed(m.loudness_range_lu)
      << " gain_db=" << Fixed(norm.applied_gain_db)
      << " peak_limited=" << (result->peak_limited ? "true" : "false")
      << " limiter_reduction_db=" << Fixed(norm.limiter.max_reduction_db)
      << " output_lufs=" << Fixed(norm.output_lufs);
  Logger::Info(msg.str());
  if (result->lra_above_target) {
    Logger::Warn("[AssemblyEngine] LRA_ABOVE_TARGET session=" + session_id +
                 " lra_lu=" + Fixed(m.loudness_range_lu) +
                 " target_lu=" + Fixed(config_.target_lra_lu));
  }
  return out;
}

void AssemblyEngine::Encode(const std::string& session_id, const audio::PcmBuffer& raw,
                            const audio::PcmBuffer& final_pcm, AssemblyResult* result) {
  const auto& layout = store_.layout();
  vault::MakeDirs(layout.FinalDir(session_id));
  result->assembly_number = store_.NextAssemblyNumber(session_id);
  const int n = result->assembly_number;

  const std::string raw_path = layout.FinalArtifact(session_id, n, "vault-raw.wav");
  const std::string wav_path = layout.FinalArtifact(session_id, n, "vault.wav");
  const std::string mp3_path = layout.FinalArtifact(session_id, n, "vault.mp3");
  const std::string manifest_path = layout.FinalArtifact(session_id, n, "assembly-manifest.json");

  audio::EncodeSettings wav;
  wav.container = audio::AudioContainer::kWavPcm16;
  audio::EncodeSettings mp3;
  mp3.container = audio::AudioContainer::kMp3;
  mp3.bit_rate = config_.mp3_bit_rate;

  PublishArtifact(session_id, raw, wav, raw_path);
  PublishArtifact(session_id, final_pcm, wav, wav_path);

  // The deliverable is encoded from the lossless artifact as written.
  audio::PcmBuffer lossless;
  std::string error;
  if (!decoder_.DecodeFile(wav_path, &lossless, &error)) {
    throw AssemblyError("AssemblyEngine: cannot re-read final WAV: " + error,
                        StageContext(session_id, AssemblyStage::kEncoded));
  }
  PublishArtifact(session_id, lossless, mp3, mp3_path);

  auto& rec = result->record;
  rec.raw_wav = "final/" + vault::BaseName(raw_path);
  rec.final_wav = "final/" + vault::BaseName(wav_path);
  rec.mp3 = "final/" + vault::BaseName(mp3_path);
  rec.manifest = "final/" + vault::BaseName(manifest_path);
  PublishText(session_id, ManifestJson(session_id, *result), manifest_path);
}

void AssemblyEngine::PublishArtifact(const std::string& session_id, const audio::PcmBuffer& pcm,
                                     const audio::EncodeSettings& settings,
                                     const std::string& path) {
  const std::string partial = vault::PartialPathFor(path);
  std::string error;
  if (!encoder_.WriteFile(pcm, partial, settings, &error)) {
    ::unlink(partial.c_str());
    throw AssemblyError("AssemblyEngine: " +
                            std::string(audio::AudioContainerToString(settings.container)) +
                            " encode failed: " + error,
                        StageContext(session_id, AssemblyStage::kEncoded));
  }
  vault::SyncPath(partial);
  vault::PublishNoReplace(partial, path);
  store_.NoteWritten(path);
}

void AssemblyEngine::PublishText(const std::string& session_id, const std::string& content,
                                 const std::string& path) {
  const std::string partial = vault::PartialPathFor(path);
  try {
    vault::WriteFileAtomic(partial, content);
  } catch (const VaultError& e) {
    throw AssemblyError(std::string("AssemblyEngine: ") + e.what(),
                        StageContext(session_id, stage_));
  }
  vault::PublishNoReplace(partial, path);
  store_.NoteWritten(path);
}

// =============================================================================
// JSON artifacts
// =============================================================================

std::string AssemblyEngine::ManifestJson(const std::string& session_id,
                                         const AssemblyResult& result) const {
  std::vector<std::string> segments;
  for (const auto& seg : result.timeline) {
    util::JsonObjectWriter w;
    w.Add("type", SegmentKindToString(seg.kind)).AddInt("index", seg.chunk_index);
    if (seg.kind == SegmentKind::kSpeech) w.AddInt("version", seg.version);
    w.AddUint("start_sample", seg.start_sample)
        .AddUint("end_sample", seg.end_sample)
        .AddDouble("start_time", seg.start_s)
        .AddDouble("end_time", seg.end_s)
        .AddDouble("duration", seg.duration_s());
    segments.push_back(w.str());
  }
  util::JsonObjectWriter w;
  w.Add("session_id", session_id)
      .AddInt("assembly_number", result.assembly_number)
      .AddInt("sample_rate", audio::kVaultSampleRate)
      .AddDouble("fade_ms", config_.fade_ms)
      .AddRaw("segments", util::JsonArray(segments));
  return w.str() + "\n";
}

std::string AssemblyEngine::ReportJson(const std::string& session_id, const AssemblyInput& input,
                                       const AssemblyResult& result) const {
  std::vector<std::string> picks;
  for (const auto& p : result.record.picks) {
    util::JsonObjectWriter w;
    w.AddInt("chunk", p.first).AddInt("version", p.second);
    picks.push_back(w.str());
  }
  std::vector<std::string> pauses;
  for (double p : result.pauses_s) pauses.push_back(util::FormatJsonDouble(p));

  util::JsonObjectWriter normalization;
  normalization.AddDouble("target_lufs", config_.target_lufs)
      .AddDouble("true_peak_ceiling_dbtp", config_.true_peak_ceiling_dbtp)
      .AddDouble("target_lra_lu", config_.target_lra_lu)
      .AddDouble("raw_integrated_lufs", result.raw_loudness.integrated_lufs)
      .AddDouble("raw_true_peak_dbtp", result.raw_loudness.true_peak_dbtp)
      .AddDouble("raw_lra_lu", result.raw_loudness.loudness_range_lu)
      .AddDouble("gain_db", result.applied_gain_db)
      .AddBool("peak_limited", result.peak_limited)
      .AddDouble("limiter_reduction_db", result.limiter_reduction_db)
      .AddBool("lra_above_target", result.lra_above_target);

  util::JsonObjectWriter w;
  w.Add("session_id", session_id)
      .Add("script_id", input.inventory.script_id())
      .AddInt("assembly_number", result.assembly_number)
      .AddInt("chunks_assembled", static_cast<int64_t>(result.record.picks.size()))
      .AddInt("total_chunks", input.inventory.size())
      .Add("final_wav", result.record.final_wav)
      .Add("raw_wav", result.record.raw_wav)
      .Add("final_mp3", result.record.mp3)
      .AddDouble("duration_seconds", result.record.duration_seconds)
      .AddOptionalDouble("target_duration_seconds", input.target_duration_s)
      .AddRaw("picks", util::JsonArray(picks))
      .AddRaw("pauses", util::JsonArray(pauses))
      .AddRaw("normalization", normalization.str())
      .AddRaw("qa", result.qa.ToJson())
      .Add("assembled_utc", util::FormatIso8601Utc(result.record.assembled_at_ms));
  return w.str() + "\n";
}

}  // namespace narrovault::assembly
