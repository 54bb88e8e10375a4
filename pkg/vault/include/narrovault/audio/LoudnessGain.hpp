// Repository: NarroVault
// Component: Loudness Gain Application
// Purpose: Apply a constant gain to float PCM for whole-file normalization.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_LOUDNESS_GAIN_HPP_
#define NARROVAULT_AUDIO_LOUDNESS_GAIN_HPP_

#include <cmath>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::audio {

// Convert dB to linear gain factor: 10^(gain_db / 20)
inline float GainDbToLinear(float gain_db) {
  return std::pow(10.0f, gain_db / 20.0f);
}

inline double LinearToDb(double linear) {
  return linear > 0.0 ? 20.0 * std::log10(linear) : -HUGE_VAL;
}

// Apply constant linear gain to every sample.
// - Sample count and timing remain unchanged.
// - Clamps to [-1, 1], no wraparound on later S16 conversion.
inline void ApplyGain(PcmBuffer& pcm, float linear_gain) {
  for (auto& s : pcm.samples) {
    float scaled = s * linear_gain;
    if (scaled > 1.0f) scaled = 1.0f;
    else if (scaled < -1.0f) scaled = -1.0f;
    s = scaled;
  }
}

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_LOUDNESS_GAIN_HPP_
