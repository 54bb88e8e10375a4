// Repository: NarroVault
// Component: Scorer
// Purpose: Composite quality score and tonal distance over decoded audio.
//          Pure functions: no I/O, no shared state.
// Copyright (c) 2026 NarroVault

#include "narrovault/scoring/Scorer.hpp"

#include <algorithm>
#include <cmath>

#include "narrovault/audio/LoudnessMeter.hpp"
#include "narrovault/scoring/Stft.hpp"

namespace narrovault::scoring {


namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kAmin = 1e-10;
constexpr double kContrastQuantile = 0.02;
constexpr double kContrastFmin = 200.0;
constexpr int kContrastOctaves = 6;

double PowerToDb(double p) { return 10.0 * std::log10(std::max(kAmin, p)); }

double HzToMel(double hz) { return 2595.0 * std::log10(1.0 + hz / 700.0); }
double MelToHz(double mel) { return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0); }

// Triangular mel filters over FFT bins (HTK mel scale, unit peak).
std::vector<std::vector<double>> MelFilterbank(int bands, int n_fft, int sample_rate) {
  const int nbins = n_fft / 2 + 1;
  const double mel_max = HzToMel(sample_rate / 2.0);
  std::vector<double> edges_hz(static_cast<size_t>(bands + 2));
  for (int i = 0; i < bands + 2; ++i) {
    edges_hz[i] = MelToHz(mel_max * i / (bands + 1));
  }
  std::vector<std::vector<double>> filters(static_cast<size_t>(bands),
                                           std::vector<double>(static_cast<size_t>(nbins), 0.0));
  for (int m = 0; m < bands; ++m) {
    const double lo = edges_hz[m];
    const double mid = edges_hz[m + 1];
    const double hi = edges_hz[m + 2];
    for (int b = 0; b < nbins; ++b) {
      double f = static_cast<double>(b) * sample_rate / n_fft;
      double w = 0.0;
      if (f > lo && f <= mid) w = (f - lo) / (mid - lo);
      else if (f > mid && f < hi) w = (hi - f) / (hi - mid);
      filters[m][b] = w;
    }
  }
  return filters;
}

}  // namespace

const char* ScoreVerdictToString(ScoreVerdict verdict) {
  switch (verdict) {
    case ScoreVerdict::kOk: return "ok";
    case ScoreVerdict::kTooShort: return "too_short";
    case ScoreVerdict::kSilent: return "silent";
    case ScoreVerdict::kClipped: return "clipped";
    case ScoreVerdict::kNoise: return "noise";
    case ScoreVerdict::kAnalysisFailed: return "analysis_failed";
  }
  return "unknown";
}

Scorer::Scorer(ScorerConfig config) : config_(config) {}

ScoreResult Scorer::Score(const audio::PcmBuffer& pcm) const {
  ScoreResult result;
  const auto& x = pcm.samples;

  if (x.size() < static_cast<size_t>(config_.n_fft)) {
    result.verdict = ScoreVerdict::kTooShort;
    return result;
  }

  result.features.rms_dbfs = audio::RmsDbfs(x, 0, x.size());
  if (result.features.rms_dbfs < config_.silence_rms_dbfs) {
    result.verdict = ScoreVerdict::kSilent;
    return result;
  }

  size_t clipped = 0;
  for (float s : x) {
    if (std::fabs(s) >= config_.clip_level) ++clipped;
  }
  result.features.clip_fraction = static_cast<double>(clipped) / static_cast<double>(x.size());

  Stft stft(config_.n_fft, config_.hop);
  std::vector<std::vector<float>> power;
  std::string error;
  if (!stft.PowerFrames(x, &power, &error) || power.empty()) {
    result.verdict = ScoreVerdict::kAnalysisFailed;
    result.detail = error.empty() ? "no analysis frames" : error;
    return result;
  }

  SpectralFeatures spectral = ComputeFeatures(power, pcm.sample_rate);
  spectral.clip_fraction = result.features.clip_fraction;
  spectral.rms_dbfs = result.features.rms_dbfs;
  result.features = spectral;

  double composite =
      1.0 / (1.0 + std::exp(-config_.logistic_slope * (spectral.raw_quality - config_.logistic_center)));

  if (spectral.spectral_flatness > config_.noise_flatness_limit) {
    result.verdict = ScoreVerdict::kNoise;
    composite *= 0.05;
  }
  if (config_.max_clip_fraction > 0.0 && spectral.clip_fraction > 0.0) {
    double penalty = 1.0 - spectral.clip_fraction / config_.max_clip_fraction;
    composite *= std::max(0.0, penalty);
    if (penalty <= 0.5) result.verdict = ScoreVerdict::kClipped;
  }
  result.composite = std::clamp(composite, 0.0, 1.0);
  return result;
}

SpectralFeatures Scorer::ComputeFeatures(const std::vector<std::vector<float>>& power,
                                         int sample_rate) const {
  SpectralFeatures f;
  const size_t nframes = power.size();
  const size_t nbins = power.front().size();
  const double bin_hz = static_cast<double>(sample_rate) / config_.n_fft;

  // Spectral flux over sum-normalised magnitude frames; its variance tracks
  // smeared, echo-like transitions.
  std::vector<double> prev(nbins, 0.0);
  std::vector<double> flux;
  flux.reserve(nframes);
  for (size_t t = 0; t < nframes; ++t) {
    std::vector<double> mag(nbins);
    double total = 0.0;
    for (size_t b = 0; b < nbins; ++b) {
      mag[b] = std::sqrt(static_cast<double>(power[t][b]));
      total += mag[b];
    }
    for (auto& m : mag) m /= (total + kAmin);
    if (t > 0) {
      double sq = 0.0;
      for (size_t b = 0; b < nbins; ++b) sq += (mag[b] - prev[b]) * (mag[b] - prev[b]);
      flux.push_back(std::sqrt(sq));
    }
    prev.swap(mag);
  }
  if (flux.size() > 1) {
    double mean = 0.0;
    for (double v : flux) mean += v;
    mean /= static_cast<double>(flux.size());
    double var = 0.0;
    for (double v : flux) var += (v - mean) * (v - mean);
    f.flux_variance = var / static_cast<double>(flux.size());
  }

  // Octave-band edges for contrast: [0, fmin), [fmin, 2 fmin), ..., [.., nyquist].
  std::vector<size_t> band_edges{0};
  for (int k = 0; k < kContrastOctaves; ++k) {
    size_t edge = static_cast<size_t>(kContrastFmin * std::pow(2.0, k) / bin_hz);
    if (edge > band_edges.back() && edge < nbins) band_edges.push_back(edge);
  }
  band_edges.push_back(nbins);

  const size_t hf_bin = static_cast<size_t>(config_.hf_cutoff_hz / bin_hz);
  double hf_energy = 0.0;
  double total_energy = 0.0;
  double flatness_sum = 0.0;
  double contrast_sum = 0.0;
  size_t contrast_count = 0;

  std::vector<double> band;
  for (size_t t = 0; t < nframes; ++t) {
    const auto& p = power[t];

    double log_sum = 0.0;
    double lin_sum = 0.0;
    for (size_t b = 0; b < nbins; ++b) {
      double v = std::max(kAmin, static_cast<double>(p[b]));
      log_sum += std::log(v);
      lin_sum += v;
      total_energy += p[b];
      if (b >= hf_bin) hf_energy += p[b];
    }
    flatness_sum += std::exp(log_sum / nbins) / (lin_sum / nbins);

    for (size_t e = 0; e + 1 < band_edges.size(); ++e) {
      band.assign(p.begin() + band_edges[e], p.begin() + band_edges[e + 1]);
      if (band.empty()) continue;
      for (auto& v : band) v = std::sqrt(v);
      std::sort(band.begin(), band.end());
      size_t k = std::max<size_t>(1, static_cast<size_t>(std::lround(kContrastQuantile * band.size())));
      double valley = 0.0;
      double peak = 0.0;
      for (size_t i = 0; i < k; ++i) {
        valley += band[i];
        peak += band[band.size() - 1 - i];
      }
      contrast_sum += PowerToDb(peak / k) - PowerToDb(valley / k);
      ++contrast_count;
    }
  }

  f.spectral_flatness = flatness_sum / static_cast<double>(nframes);
  f.spectral_contrast = contrast_count > 0 ? contrast_sum / contrast_count : 0.0;
  f.hf_ratio_db = PowerToDb(hf_energy / (total_energy + kAmin));

  f.raw_quality = config_.flux_weight * f.flux_variance +
                  config_.contrast_weight * f.spectral_contrast +
                  config_.flatness_weight * f.spectral_flatness +
                  config_.hf_ratio_weight * f.hf_ratio_db;
  return f;
}

MfccProfile Scorer::Profile(const audio::PcmBuffer& pcm, std::string* error) const {
  MfccProfile profile;
  Stft stft(config_.n_fft, config_.hop);
  std::vector<std::vector<float>> power;
  std::string stft_error;
  if (!stft.PowerFrames(pcm.samples, &power, &stft_error)) {
    if (error) *error = stft_error;
    return profile;
  }
  if (power.empty()) return profile;

  const auto filters = MelFilterbank(config_.mel_bands, config_.n_fft, pcm.sample_rate);
  const int n_mels = config_.mel_bands;
  const int n_mfcc = std::min(config_.mfcc_coefficients, n_mels);
  profile.coefficients.assign(static_cast<size_t>(n_mfcc), 0.0);

  std::vector<double> log_mel(static_cast<size_t>(n_mels));
  for (const auto& frame : power) {
    for (int m = 0; m < n_mels; ++m) {
      double e = 0.0;
      for (size_t b = 0; b < frame.size(); ++b) e += filters[m][b] * frame[b];
      log_mel[m] = PowerToDb(e);
    }
    // Orthonormal DCT-II.
    for (int k = 0; k < n_mfcc; ++k) {
      double acc = 0.0;
      for (int n = 0; n < n_mels; ++n) {
        acc += log_mel[n] * std::cos(kPi * k * (2.0 * n + 1.0) / (2.0 * n_mels));
      }
      acc *= (k == 0) ? std::sqrt(1.0 / n_mels) : std::sqrt(2.0 / n_mels);
      profile.coefficients[k] += acc;
    }
  }
  for (auto& c : profile.coefficients) c /= static_cast<double>(power.size());
  return profile;
}

double Scorer::TonalDistance(const MfccProfile& a, const MfccProfile& b) {
  const size_t n = std::min(a.coefficients.size(), b.coefficients.size());
  double dot = 0.0, na = 0.0, nb = 0.0;
  for (size_t i = 0; i < n; ++i) {
    dot += a.coefficients[i] * b.coefficients[i];
    na += a.coefficients[i] * a.coefficients[i];
    nb += b.coefficients[i] * b.coefficients[i];
  }
  if (na <= 0.0 && nb <= 0.0) return 0.0;
  if (na <= 0.0 || nb <= 0.0) return 1.0;
  double cosine = dot / (std::sqrt(na) * std::sqrt(nb));
  return std::max(0.0, 1.0 - cosine);
}

double Scorer::TonalDistance(const audio::PcmBuffer& a, const audio::PcmBuffer& b) const {
  return TonalDistance(Profile(a), Profile(b));
}

}  // namespace narrovault::scoring
