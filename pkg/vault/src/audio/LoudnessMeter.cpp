// Repository: NarroVault
// Component: Loudness Meter
// Purpose: ITU-R BS.1770 integrated loudness, EBU Tech 3342 loudness range,
//          4x oversampled true peak, plus plain RMS/peak helpers used by the
//          scorer and QA gates.
// Copyright (c) 2026 NarroVault

#include "narrovault/audio/LoudnessMeter.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace narrovault::audio {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kAbsoluteGateLufs = -70.0;
constexpr double kIntegratedRelativeGateLu = -10.0;
constexpr double kRangeRelativeGateLu = -20.0;
constexpr double kBlockSeconds = 0.4;
constexpr double kShortTermSeconds = 3.0;
constexpr double kStepSeconds = 0.1;
constexpr int kOversample = 4;
constexpr int kInterpHalfWidth = 16;

struct Biquad {
  double b0, b1, b2, a1, a2;
};

// BS.1770 stage 1: high-shelf pre-filter, designed for any sample rate.
Biquad PreFilter(double fs) {
  const double f0 = 1681.974450955533;
  const double g = 3.999843853973347;
  const double q = 0.7071752369554196;
  const double k = std::tan(kPi * f0 / fs);
  const double vh = std::pow(10.0, g / 20.0);
  const double vb = std::pow(vh, 0.4996667741545416);
  const double a0 = 1.0 + k / q + k * k;
  return {(vh + vb * k / q + k * k) / a0,
          2.0 * (k * k - vh) / a0,
          (vh - vb * k / q + k * k) / a0,
          2.0 * (k * k - 1.0) / a0,
          (1.0 - k / q + k * k) / a0};
}

// BS.1770 stage 2: RLB high-pass.
Biquad RlbFilter(double fs) {
  const double f0 = 38.13547087602444;
  const double q = 0.5003270373238773;
  const double k = std::tan(kPi * f0 / fs);
  const double a0 = 1.0 + k / q + k * k;
  return {1.0, -2.0, 1.0, 2.0 * (k * k - 1.0) / a0, (1.0 - k / q + k * k) / a0};
}

// One second-order section of a Butterworth high-pass.
Biquad HighPassSection(double fs, double f0, double q) {
  const double k = std::tan(kPi * f0 / fs);
  const double a0 = 1.0 + k / q + k * k;
  return {1.0 / a0, -2.0 / a0, 1.0 / a0, 2.0 * (k * k - 1.0) / a0, (1.0 - k / q + k * k) / a0};
}

void RunBiquad(const Biquad& f, std::vector<double>& x) {
  double x1 = 0.0, x2 = 0.0, y1 = 0.0, y2 = 0.0;
  for (auto& v : x) {
    double y = f.b0 * v + f.b1 * x1 + f.b2 * x2 - f.a1 * y1 - f.a2 * y2;
    x2 = x1;
    x1 = v;
    y2 = y1;
    y1 = y;
    v = y;
  }
}

double PowerToLufs(double mean_square) {
  return mean_square > 0.0 ? -0.691 + 10.0 * std::log10(mean_square) : -HUGE_VAL;
}

// Mean-square loudness of windows of window_s, hopped by kStepSeconds.
std::vector<double> WindowPowers(const PcmBuffer& pcm, double window_s) {
  std::vector<double> k = KWeight(pcm);
  const size_t window = static_cast<size_t>(window_s * pcm.sample_rate);
  const size_t step = static_cast<size_t>(kStepSeconds * pcm.sample_rate);
  std::vector<double> powers;
  if (window == 0 || step == 0 || k.size() < window) return powers;

  std::vector<double> prefix(k.size() + 1, 0.0);
  for (size_t i = 0; i < k.size(); ++i) prefix[i + 1] = prefix[i] + k[i] * k[i];
  for (size_t start = 0; start + window <= k.size(); start += step) {
    powers.push_back((prefix[start + window] - prefix[start]) / static_cast<double>(window));
  }
  return powers;
}

double Sinc(double x) {
  if (std::fabs(x) < 1e-12) return 1.0;
  return std::sin(kPi * x) / (kPi * x);
}

}  // namespace

std::vector<double> KWeight(const PcmBuffer& pcm) {
  std::vector<double> x(pcm.samples.begin(), pcm.samples.end());
  const double fs = static_cast<double>(pcm.sample_rate);
  RunBiquad(PreFilter(fs), x);
  RunBiquad(RlbFilter(fs), x);
  return x;
}

std::vector<double> HighPass(const PcmBuffer& pcm, double cutoff_hz) {
  std::vector<double> x(pcm.samples.begin(), pcm.samples.end());
  const double fs = static_cast<double>(pcm.sample_rate);
  RunBiquad(HighPassSection(fs, cutoff_hz, 0.5411961001461970), x);
  RunBiquad(HighPassSection(fs, cutoff_hz, 1.3065629648763766), x);
  return x;
}

double IntegratedLoudness(const PcmBuffer& pcm) {
  std::vector<double> powers = WindowPowers(pcm, kBlockSeconds);

  double sum = 0.0;
  size_t count = 0;
  for (double p : powers) {
    if (PowerToLufs(p) > kAbsoluteGateLufs) {
      sum += p;
      ++count;
    }
  }
  if (count == 0) return -HUGE_VAL;

  const double relative_gate = PowerToLufs(sum / count) + kIntegratedRelativeGateLu;
  sum = 0.0;
  count = 0;
  for (double p : powers) {
    double l = PowerToLufs(p);
    if (l > kAbsoluteGateLufs && l > relative_gate) {
      sum += p;
      ++count;
    }
  }
  if (count == 0) return -HUGE_VAL;
  return PowerToLufs(sum / count);
}

double LoudnessRange(const PcmBuffer& pcm) {
  std::vector<double> powers = WindowPowers(pcm, kShortTermSeconds);

  std::vector<double> gated;
  double sum = 0.0;
  for (double p : powers) {
    if (PowerToLufs(p) > kAbsoluteGateLufs) {
      gated.push_back(p);
      sum += p;
    }
  }
  if (gated.size() < 2) return 0.0;

  const double relative_gate = PowerToLufs(sum / gated.size()) + kRangeRelativeGateLu;
  std::vector<double> levels;
  for (double p : gated) {
    double l = PowerToLufs(p);
    if (l > relative_gate) levels.push_back(l);
  }
  if (levels.size() < 2) return 0.0;

  std::sort(levels.begin(), levels.end());
  auto percentile = [&levels](double pct) {
    double rank = pct / 100.0 * static_cast<double>(levels.size() - 1);
    size_t idx = static_cast<size_t>(std::lround(rank));
    return levels[std::min(idx, levels.size() - 1)];
  };
  return percentile(95.0) - percentile(10.0);
}

double TruePeakDbtp(const PcmBuffer& pcm) {
  const auto& x = pcm.samples;
  if (x.empty()) return -HUGE_VAL;

  double peak = PeakAbs(x, 0, x.size());
  if (peak <= 0.0) return -HUGE_VAL;

  // Windowed-sinc interpolation coefficients for the 3 intermediate phases.
  std::array<std::array<double, 2 * kInterpHalfWidth>, kOversample - 1> taps{};
  for (int p = 1; p < kOversample; ++p) {
    double frac = static_cast<double>(p) / kOversample;
    for (int j = 0; j < 2 * kInterpHalfWidth; ++j) {
      int k = j - kInterpHalfWidth + 1;  // sample offset relative to n
      double d = frac - k;
      double w = 0.5 * (1.0 + std::cos(kPi * d / kInterpHalfWidth));
      taps[p - 1][j] = Sinc(d) * w;
    }
  }

  // Inter-sample overshoot only matters near the sample peak, so only
  // interpolate where a neighbouring sample is within 6 dB of it.
  const double threshold = peak * 0.5;
  const long n_total = static_cast<long>(x.size());
  double true_peak = peak;
  for (long n = 0; n + 1 < n_total; ++n) {
    if (std::fabs(x[n]) < threshold && std::fabs(x[n + 1]) < threshold) continue;
    for (int p = 0; p < kOversample - 1; ++p) {
      double acc = 0.0;
      for (int j = 0; j < 2 * kInterpHalfWidth; ++j) {
        long idx = n + j - kInterpHalfWidth + 1;
        if (idx < 0 || idx >= n_total) continue;
        acc += x[idx] * taps[p][j];
      }
      true_peak = std::max(true_peak, std::fabs(acc));
    }
  }
  return 20.0 * std::log10(true_peak);
}

LoudnessMeasurement MeasureLoudness(const PcmBuffer& pcm) {
  LoudnessMeasurement m;
  m.integrated_lufs = IntegratedLoudness(pcm);
  m.loudness_range_lu = LoudnessRange(pcm);
  m.true_peak_dbtp = TruePeakDbtp(pcm);
  double peak = PeakAbs(pcm.samples, 0, pcm.samples.size());
  m.sample_peak_dbfs = peak > 0.0 ? 20.0 * std::log10(peak) : -HUGE_VAL;
  return m;
}

double RmsDbfs(const std::vector<float>& samples, size_t begin, size_t count) {
  if (begin >= samples.size() || count == 0) return -HUGE_VAL;
  size_t end = std::min(samples.size(), begin + count);
  double sum = 0.0;
  for (size_t i = begin; i < end; ++i) sum += static_cast<double>(samples[i]) * samples[i];
  double mean = sum / static_cast<double>(end - begin);
  return mean > 0.0 ? 10.0 * std::log10(mean) : -HUGE_VAL;
}

double PeakAbs(const std::vector<float>& samples, size_t begin, size_t count) {
  if (begin >= samples.size()) return 0.0;
  size_t end = std::min(samples.size(), begin + count);
  double peak = 0.0;
  for (size_t i = begin; i < end; ++i) peak = std::max(peak, static_cast<double>(std::fabs(samples[i])));
  return peak;
}

}  // namespace narrovault::audio
