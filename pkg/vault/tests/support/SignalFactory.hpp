// Repository: NarroVault
// Component: Test signals
// Purpose: Deterministic synthetic audio for scorer, loudness, QA and
//          pipeline tests.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_TESTS_SUPPORT_SIGNAL_FACTORY_HPP_
#define NARROVAULT_TESTS_SUPPORT_SIGNAL_FACTORY_HPP_

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::test_infra {

inline constexpr double kTestPi = 3.14159265358979323846;

// Steady voiced tone: fundamental plus four decaying harmonics, peak near
// `amplitude`. Scores well and stays level across analysis windows.
inline audio::PcmBuffer VoicedTone(double seconds, double f0_hz = 220.0, double amplitude = 0.3,
                                   int sample_rate = audio::kVaultSampleRate) {
  audio::PcmBuffer pcm;
  pcm.sample_rate = sample_rate;
  const size_t n = audio::PcmBuffer::SamplesFor(seconds, sample_rate);
  pcm.samples.resize(n);
  const double weights[] = {1.0, 0.5, 0.3, 0.2, 0.1};
  double norm = 0.0;
  for (double w : weights) norm += w;
  for (size_t i = 0; i < n; ++i) {
    const double t = static_cast<double>(i) / sample_rate;
    double v = 0.0;
    for (int h = 0; h < 5; ++h) v += weights[h] * std::sin(2.0 * kTestPi * f0_hz * (h + 1) * t);
    pcm.samples[i] = static_cast<float>(amplitude * v / norm);
  }
  return pcm;
}

inline audio::PcmBuffer Sine(double seconds, double hz, double amplitude,
                             int sample_rate = audio::kVaultSampleRate) {
  audio::PcmBuffer pcm;
  pcm.sample_rate = sample_rate;
  const size_t n = audio::PcmBuffer::SamplesFor(seconds, sample_rate);
  pcm.samples.resize(n);
  for (size_t i = 0; i < n; ++i) {
    pcm.samples[i] = static_cast<float>(
        amplitude * std::sin(2.0 * kTestPi * hz * static_cast<double>(i) / sample_rate));
  }
  return pcm;
}

// Uniform white noise; flat spectrum.
inline audio::PcmBuffer WhiteNoise(double seconds, double amplitude, uint32_t seed = 7,
                                   int sample_rate = audio::kVaultSampleRate) {
  audio::PcmBuffer pcm;
  pcm.sample_rate = sample_rate;
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  const size_t n = audio::PcmBuffer::SamplesFor(seconds, sample_rate);
  pcm.samples.resize(n);
  for (auto& s : pcm.samples) s = static_cast<float>(amplitude) * dist(rng);
  return pcm;
}

inline void Append(audio::PcmBuffer& dst, const audio::PcmBuffer& src) {
  dst.samples.insert(dst.samples.end(), src.samples.begin(), src.samples.end());
}

// RIFF/WAVE PCM S16LE mono, as a synthesis service would return it.
inline std::vector<uint8_t> WavBytes(const audio::PcmBuffer& pcm) {
  std::vector<uint8_t> out;
  auto put16 = [&out](uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
  };
  auto put32 = [&out](uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
  };
  auto tag = [&out](const char* t) { out.insert(out.end(), t, t + 4); };

  const uint32_t data_bytes = static_cast<uint32_t>(pcm.samples.size() * 2);
  const uint32_t rate = static_cast<uint32_t>(pcm.sample_rate);
  tag("RIFF");
  put32(36 + data_bytes);
  tag("WAVE");
  tag("fmt ");
  put32(16);
  put16(1);         // PCM
  put16(1);         // mono
  put32(rate);
  put32(rate * 2);  // byte rate
  put16(2);         // block align
  put16(16);        // bits per sample
  tag("data");
  put32(data_bytes);
  for (float s : pcm.samples) {
    float c = s > 1.0f ? 1.0f : (s < -1.0f ? -1.0f : s);
    const int16_t v = static_cast<int16_t>(std::lrint(c * 32767.0f));
    put16(static_cast<uint16_t>(v));
  }
  return out;
}

}  // namespace narrovault::test_infra

#endif  // NARROVAULT_TESTS_SUPPORT_SIGNAL_FACTORY_HPP_
