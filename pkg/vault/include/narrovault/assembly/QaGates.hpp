// Repository: NarroVault
// Component: QA gates
// Purpose: Automated checks on an assembled session before it may ship.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ASSEMBLY_QA_GATES_HPP_
#define NARROVAULT_ASSEMBLY_QA_GATES_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "narrovault/assembly/AssemblyTypes.hpp"
#include "narrovault/audio/LoudnessMeter.hpp"
#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::assembly {

struct QaConfig {
  // decodable
  double duration_tolerance_s = 0.05;

  // clicks_in_silence / silence_integrity. Each silence region is scanned
  // without its first and last guard_ms.
  double guard_ms = 20.0;
  double click_jump_threshold = 0.05;
  double silence_max_dbfs = -50.0;

  // loudness_consistency / surge_drop, over 1 s speech windows.
  double window_s = 1.0;
  double min_window_s = 0.25;
  double consistency_max_above_median_db = 10.0;
  double surge_max_db = 9.0;
  double drop_max_db = 14.0;

  // integrated_loudness / true_peak
  double loudness_tolerance_lu = 1.0;
  double true_peak_tolerance_db = 0.1;

  // target_duration (skipped without a target)
  double target_duration_tolerance = 0.15;

  // energy_spike / spectral_comparison, over 2 s windows every 1 s. A window
  // is speech when it starts inside a speech segment. Band levels below
  // band_floor_dbfs are inaudible and never flagged.
  double analysis_window_s = 2.0;
  double analysis_hop_s = 1.0;
  double band_floor_dbfs = -60.0;
  double spike_cutoff_hz = 4000.0;
  double spike_total_ratio = 12.0;
  double spike_band_ratio = 28.0;
  double spectral_cutoff_hz = 6000.0;
  double spectral_max_deviation_db = 18.0;
  int spectral_min_speech_windows = 6;

  // speech_rate, characters per second of each speech segment.
  double rush_ratio = 1.3;
  double rush_floor_cps = 18.0;
  double implausible_rate_cps = 40.0;
  double min_rate_segment_s = 1.0;
  int min_rate_segments = 5;
};

struct QaGateResult {
  std::string name;
  bool passed = true;
  bool skipped = false;
  std::string detail;
};

struct QaReport {
  bool passed = true;
  std::vector<QaGateResult> gates;
  audio::LoudnessMeasurement final_loudness;
  double final_duration_s = 0.0;

  std::vector<std::string> FailedGates() const;
  std::string ToJson() const;
};

struct QaInput {
  std::string final_wav_path;
  // Pre-normalization concatenation; surge/drop is judged on natural
  // dynamics.
  const audio::PcmBuffer* raw = nullptr;
  const Timeline* timeline = nullptr;
  double target_lufs = -26.0;
  double true_peak_ceiling_dbtp = -2.0;
  std::optional<double> target_duration_s;
  // chunk_index -> character count; speech_rate is skipped without it.
  const std::map<int, int>* chunk_characters = nullptr;
};

class QaGates {
 public:
  explicit QaGates(QaConfig config = {});

  // Decodes the final artifact from disk and runs every gate; never throws
  // for a failing gate.
  QaReport Run(const QaInput& input) const;

  const QaConfig& config() const { return config_; }

  // Gate primitives, exposed for contract tests.
  QaGateResult CheckClicksInSilence(const audio::PcmBuffer& pcm, const Timeline& timeline) const;
  QaGateResult CheckSilenceIntegrity(const audio::PcmBuffer& pcm, const Timeline& timeline) const;
  QaGateResult CheckLoudnessConsistency(const audio::PcmBuffer& pcm,
                                        const Timeline& timeline) const;
  QaGateResult CheckSurgeDrop(const audio::PcmBuffer& pcm, const Timeline& timeline) const;
  QaGateResult CheckEnergySpikes(const audio::PcmBuffer& pcm, const Timeline& timeline) const;
  QaGateResult CheckSpectralComparison(const audio::PcmBuffer& pcm,
                                       const Timeline& timeline) const;
  QaGateResult CheckSpeechRate(const Timeline& timeline,
                               const std::map<int, int>& chunk_characters) const;

  // RMS (dBFS) of each speech window in timeline order.
  std::vector<double> SpeechWindowLevels(const audio::PcmBuffer& pcm,
                                         const Timeline& timeline) const;

 private:
  QaConfig config_;
};

}  // namespace narrovault::assembly

#endif  // NARROVAULT_ASSEMBLY_QA_GATES_HPP_
