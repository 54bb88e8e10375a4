// Repository: NarroVault
// Component: PCM buffer
// Purpose: Decoded mono audio as normalized float samples.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_PCM_BUFFER_HPP_
#define NARROVAULT_AUDIO_PCM_BUFFER_HPP_

#include <cstddef>
#include <vector>

namespace narrovault::audio {

// Vault audio format: mono, 44.1 kHz, stored as PCM S16LE.
inline constexpr int kVaultSampleRate = 44100;

struct PcmBuffer {
  int sample_rate = kVaultSampleRate;
  std::vector<float> samples;  // mono, nominal range [-1, 1]

  size_t size() const { return samples.size(); }
  bool empty() const { return samples.empty(); }

  double DurationSeconds() const {
    return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
  }

  static size_t SamplesFor(double seconds, int sample_rate) {
    if (seconds <= 0.0) return 0;
    return static_cast<size_t>(seconds * sample_rate + 0.5);
  }

  static PcmBuffer Silence(double seconds, int sample_rate = kVaultSampleRate) {
    PcmBuffer b;
    b.sample_rate = sample_rate;
    b.samples.assign(SamplesFor(seconds, sample_rate), 0.0f);
    return b;
  }
};

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_PCM_BUFFER_HPP_
