// Repository: NarroVault
// Component: Scorer
// Purpose: Composite quality score and tonal distance over decoded audio.
//          Pure functions: no I/O, no shared state.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SCORING_SCORER_HPP_
#define NARROVAULT_SCORING_SCORER_HPP_

#include <string>
#include <vector>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::scoring {

struct ScorerConfig {
  int n_fft = 2048;
  int hop = 512;

  // Hard gates.
  double silence_rms_dbfs = -60.0;
  double clip_level = 0.999;
  // Clipped-sample fraction at which the score reaches 0.
  double max_clip_fraction = 0.01;
  double noise_flatness_limit = 0.35;

  // Raw quality weights.
  double flux_weight = -500.0;
  double contrast_weight = 0.05;
  double flatness_weight = -10.0;
  double hf_ratio_weight = -0.05;
  double hf_cutoff_hz = 6000.0;

  // Logistic mapping of raw quality onto [0, 1].
  double logistic_center = 1.0;
  double logistic_slope = 1.5;

  int mel_bands = 40;
  int mfcc_coefficients = 13;
};

struct SpectralFeatures {
  double flux_variance = 0.0;
  double spectral_contrast = 0.0;   // dB, mean over bands and frames
  double spectral_flatness = 0.0;   // [0, 1]
  double hf_ratio_db = 0.0;         // energy above hf_cutoff_hz vs total
  double clip_fraction = 0.0;
  double rms_dbfs = 0.0;
  double raw_quality = 0.0;
};

enum class ScoreVerdict {
  kOk,
  kTooShort,
  kSilent,
  kClipped,
  kNoise,
  kAnalysisFailed,
};

const char* ScoreVerdictToString(ScoreVerdict verdict);

struct ScoreResult {
  double composite = 0.0;  // [0, 1]
  ScoreVerdict verdict = ScoreVerdict::kOk;
  SpectralFeatures features;
  std::string detail;  // set with kAnalysisFailed
};

// Mean MFCC vector of a buffer.
struct MfccProfile {
  std::vector<double> coefficients;
  bool empty() const { return coefficients.empty(); }
};

class Scorer {
 public:
  explicit Scorer(ScorerConfig config = {});

  ScoreResult Score(const audio::PcmBuffer& pcm) const;

  // Empty profile for buffers shorter than one analysis window, or when the
  // analysis fails (reason in *error when given).
  MfccProfile Profile(const audio::PcmBuffer& pcm, std::string* error = nullptr) const;

  // Cosine distance between profiles: symmetric, 0 for identical audio,
  // clamped to >= 0.
  static double TonalDistance(const MfccProfile& a, const MfccProfile& b);
  double TonalDistance(const audio::PcmBuffer& a, const audio::PcmBuffer& b) const;

  const ScorerConfig& config() const { return config_; }

 private:
  SpectralFeatures ComputeFeatures(const std::vector<std::vector<float>>& power,
                                   int sample_rate) const;

  ScorerConfig config_;
};

}  // namespace narrovault::scoring

#endif  // NARROVAULT_SCORING_SCORER_HPP_
