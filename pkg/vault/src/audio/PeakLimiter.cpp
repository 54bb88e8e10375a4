// Repository: NarroVault
// Component: True-Peak Limiter
// Purpose: Whole-file loudness normalization that reaches the integrated
//          target while holding the true peak under a ceiling.
// Copyright (c) 2026 NarroVault

#include "narrovault/audio/PeakLimiter.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <vector>

#include "narrovault/audio/LoudnessGain.hpp"
#include "narrovault/audio/LoudnessMeter.hpp"

namespace narrovault::audio {

namespace {

constexpr int kMakeupIterations = 4;
constexpr double kLoudnessToleranceLu = 0.1;

double DbToLinear(double db) { return std::pow(10.0, db / 20.0); }

// Reduces gain around every sample above threshold. Returns the smallest
// gain applied.
double ReduceAbove(std::vector<float>& x, double threshold, size_t radius) {
  const size_t n = x.size();
  std::vector<double> required(n, 1.0);
  bool any = false;
  for (size_t i = 0; i < n; ++i) {
    const double a = std::fabs(static_cast<double>(x[i]));
    if (a > threshold) {
      required[i] = threshold / a;
      any = true;
    }
  }
  if (!any) return 1.0;

  // hold[i] = min(required[i - radius .. i + radius])
  std::vector<double> hold(n, 1.0);
  std::deque<size_t> window;
  size_t next = 0;
  for (size_t i = 0; i < n; ++i) {
    const size_t hi = std::min(n - 1, i + radius);
    while (next <= hi) {
      while (!window.empty() && required[window.back()] >= required[next]) window.pop_back();
      window.push_back(next);
      ++next;
    }
    const size_t lo = i >= radius ? i - radius : 0;
    while (window.front() < lo) window.pop_front();
    hold[i] = required[window.front()];
  }

  // Centered moving average over radius/2 smooths attack and release. Every
  // averaged hold value already covers sample i, so gain[i] <= required[i].
  const size_t half = std::max<size_t>(1, radius / 2);
  std::vector<double> prefix(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i) prefix[i + 1] = prefix[i] + hold[i];

  double min_gain = 1.0;
  for (size_t i = 0; i < n; ++i) {
    const size_t lo = i >= half ? i - half : 0;
    const size_t hi = std::min(n, i + half + 1);
    double g = (prefix[hi] - prefix[lo]) / static_cast<double>(hi - lo);
    g = std::min(g, required[i]);
    x[i] = static_cast<float>(static_cast<double>(x[i]) * g);
    min_gain = std::min(min_gain, g);
  }
  return min_gain;
}

}  // namespace

PcmBuffer ApplyGainWithPeakLimit(const PcmBuffer& in, double gain_db,
                                 const PeakLimiterConfig& config, LimiterReport* report) {
  LimiterReport local;
  LimiterReport& r = report ? *report : local;
  r = LimiterReport{};

  PcmBuffer out = in;
  const double gain = DbToLinear(gain_db);
  for (auto& s : out.samples) s = static_cast<float>(static_cast<double>(s) * gain);

  const double aim_dbtp = config.ceiling_dbtp - config.headroom_db;
  const size_t radius = PcmBuffer::SamplesFor(config.lookahead_ms / 1000.0, out.sample_rate);
  double total_gain = 1.0;

  for (int pass = 0; pass < config.max_passes; ++pass) {
    const double tp = TruePeakDbtp(out);
    if (!std::isfinite(tp) || tp <= aim_dbtp) break;
    const double sample_peak = PeakAbs(out.samples, 0, out.samples.size());
    const double sample_peak_db = 20.0 * std::log10(sample_peak);
    // Inter-sample overshoot is carried by the neighbourhood of the peak, so
    // the sample threshold is lowered by the measured overshoot.
    const double overshoot_db = std::max(0.0, tp - sample_peak_db);
    const double threshold = DbToLinear(aim_dbtp - overshoot_db);
    total_gain *= ReduceAbove(out.samples, threshold, radius);
    r.engaged = true;
    r.passes = pass + 1;
  }

  // Pathological content the passes could not tame: scale the whole file.
  const double residual = TruePeakDbtp(out) - aim_dbtp;
  if (std::isfinite(residual) && residual > 0.0) {
    ApplyGain(out, static_cast<float>(DbToLinear(-residual)));
    total_gain *= DbToLinear(-residual);
    r.engaged = true;
  }

  r.max_reduction_db = total_gain < 1.0 ? -20.0 * std::log10(total_gain) : 0.0;
  return out;
}

PcmBuffer NormalizeLoudness(const PcmBuffer& in, double target_lufs,
                            const PeakLimiterConfig& config, NormalizationReport* report,
                            double max_makeup_db) {
  NormalizationReport local;
  NormalizationReport& r = report ? *report : local;
  r = NormalizationReport{};
  r.measured_lufs = IntegratedLoudness(in);
  if (!std::isfinite(r.measured_lufs)) {
    r.output_lufs = r.measured_lufs;
    r.output_true_peak_dbtp = TruePeakDbtp(in);
    return in;
  }

  const double base_gain_db = target_lufs - r.measured_lufs;
  double gain_db = base_gain_db;
  PcmBuffer out;
  for (int i = 0; i < kMakeupIterations; ++i) {
    out = ApplyGainWithPeakLimit(in, gain_db, config, &r.limiter);
    r.applied_gain_db = gain_db;
    r.output_lufs = IntegratedLoudness(out);
    const double shortfall = target_lufs - r.output_lufs;
    if (!r.limiter.engaged || !std::isfinite(shortfall) || shortfall <= kLoudnessToleranceLu) break;
    const double next = std::min(gain_db + shortfall, base_gain_db + max_makeup_db);
    if (next <= gain_db) break;
    gain_db = next;
  }
  r.output_true_peak_dbtp = TruePeakDbtp(out);
  return out;
}

}  // namespace narrovault::audio
