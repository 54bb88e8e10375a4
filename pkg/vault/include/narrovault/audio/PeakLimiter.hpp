// Repository: NarroVault
// Component: True-Peak Limiter
// Purpose: Whole-file loudness normalization that reaches the integrated
//          target while holding the true peak under a ceiling.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_PEAK_LIMITER_HPP_
#define NARROVAULT_AUDIO_PEAK_LIMITER_HPP_

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::audio {

struct PeakLimiterConfig {
  double ceiling_dbtp = -2.0;
  // Limiter aims this far under the ceiling so 16-bit requantization of the
  // written file cannot push the re-measured peak over it.
  double headroom_db = 0.1;
  // Gain reduction starts this long before a peak and holds as long after it.
  double lookahead_ms = 5.0;
  int max_passes = 4;
};

struct LimiterReport {
  bool engaged = false;
  double max_reduction_db = 0.0;
  int passes = 0;
};

// Multiplies by gain_db, then applies look-ahead gain reduction wherever the
// 4x oversampled true peak would exceed the ceiling. Deterministic. The
// gain envelope is never above the per-sample requirement, so no sample is
// clipped.
PcmBuffer ApplyGainWithPeakLimit(const PcmBuffer& in, double gain_db,
                                 const PeakLimiterConfig& config, LimiterReport* report);

struct NormalizationReport {
  double measured_lufs = 0.0;
  double applied_gain_db = 0.0;  // static gain, makeup included
  double output_lufs = 0.0;
  double output_true_peak_dbtp = 0.0;
  LimiterReport limiter;
};

// Gain to target_lufs, limited to the ceiling. When limiting pulls the
// integrated loudness below target, makeup gain is added (up to
// max_makeup_db) and the limiter re-run. Silent input is returned unchanged.
PcmBuffer NormalizeLoudness(const PcmBuffer& in, double target_lufs,
                            const PeakLimiterConfig& config, NormalizationReport* report,
                            double max_makeup_db = 6.0);

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_PEAK_LIMITER_HPP_
