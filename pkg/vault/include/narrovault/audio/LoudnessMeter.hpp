// Repository: NarroVault
// Component: Loudness Meter
// Purpose: ITU-R BS.1770 integrated loudness, EBU Tech 3342 loudness range,
//          4x oversampled true peak, plus plain RMS/peak helpers used by the
//          scorer and QA gates.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_LOUDNESS_METER_HPP_
#define NARROVAULT_AUDIO_LOUDNESS_METER_HPP_

#include <cstddef>
#include <vector>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::audio {

struct LoudnessMeasurement {
  // -inf when every block is below the absolute gate (silence).
  double integrated_lufs = 0.0;
  double loudness_range_lu = 0.0;
  double true_peak_dbtp = 0.0;
  double sample_peak_dbfs = 0.0;
};

// Mono measurement (channel weight 1.0).
LoudnessMeasurement MeasureLoudness(const PcmBuffer& pcm);

double IntegratedLoudness(const PcmBuffer& pcm);
double LoudnessRange(const PcmBuffer& pcm);
double TruePeakDbtp(const PcmBuffer& pcm);

// K-weighted signal (pre-filter + RLB high-pass) at pcm.sample_rate.
std::vector<double> KWeight(const PcmBuffer& pcm);

// Fourth-order Butterworth high-pass at cutoff_hz.
std::vector<double> HighPass(const PcmBuffer& pcm, double cutoff_hz);

// RMS of samples [begin, begin + count) in dBFS; -inf for digital silence or
// an empty range.
double RmsDbfs(const std::vector<float>& samples, size_t begin, size_t count);
double PeakAbs(const std::vector<float>& samples, size_t begin, size_t count);

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_LOUDNESS_METER_HPP_
