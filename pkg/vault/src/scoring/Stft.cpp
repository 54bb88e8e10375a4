// Repository: NarroVault
// Component: Short-time Fourier transform
// Purpose: Hann-windowed power spectrogram built on FFmpeg's real FFT
//          (libavutil/tx.h).
// Copyright (c) 2026 NarroVault

#include "narrovault/scoring/Stft.hpp"

#include <cerrno>
#include <cmath>

extern "C" {
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/tx.h>
}

namespace narrovault::scoring {

namespace {
constexpr double kPi = 3.14159265358979323846;
}  // namespace

Stft::Stft(int n_fft, int hop) : n_fft_(n_fft), hop_(hop > 0 ? hop : n_fft / 4) {
  // The real transform needs an even size of at least four.
  if (n_fft_ < 4 || n_fft_ % 2 != 0) {
    init_error_ = AVERROR(EINVAL);
    return;
  }
  window_.resize(static_cast<size_t>(n_fft_));
  // Periodic Hann window.
  for (int i = 0; i < n_fft_; ++i) {
    window_[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * kPi * i / n_fft_));
  }
  const float scale = 1.0f;
  av_tx_fn fn = nullptr;
  init_error_ = av_tx_init(&tx_ctx_, &fn, AV_TX_FLOAT_RDFT, 0, n_fft_, &scale, 0);
  tx_fn_ = fn;
}

Stft::~Stft() {
  if (tx_ctx_) av_tx_uninit(&tx_ctx_);
}

bool Stft::PowerFrames(const std::vector<float>& samples,
                       std::vector<std::vector<float>>* frames,
                       std::string* error) {
  frames->clear();
  if (init_error_ < 0 || !tx_ctx_ || !tx_fn_) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(init_error_, errbuf, sizeof(errbuf));
    *error = std::string("[Stft] transform setup failed: ") + errbuf;
    return false;
  }
  if (samples.size() < static_cast<size_t>(n_fft_)) return true;

  // av_tx requires CPU-aligned buffers.
  auto* in = static_cast<float*>(av_malloc(sizeof(float) * (n_fft_ + 2)));
  auto* out = static_cast<AVComplexFloat*>(av_malloc(sizeof(AVComplexFloat) * (n_fft_ / 2 + 1)));
  if (!in || !out) {
    av_free(in);
    av_free(out);
    *error = "[Stft] Failed to allocate FFT buffers";
    return false;
  }

  const int nbins = bins();
  for (size_t start = 0; start + n_fft_ <= samples.size(); start += static_cast<size_t>(hop_)) {
    for (int i = 0; i < n_fft_; ++i) in[i] = samples[start + i] * window_[i];
    tx_fn_(tx_ctx_, out, in, sizeof(float));
    std::vector<float> power(static_cast<size_t>(nbins));
    for (int b = 0; b < nbins; ++b) {
      power[b] = out[b].re * out[b].re + out[b].im * out[b].im;
    }
    frames->push_back(std::move(power));
  }

  av_free(in);
  av_free(out);
  return true;
}

}  // namespace narrovault::scoring
