// Repository: NarroVault
// Component: Short-time Fourier transform
// Purpose: Hann-windowed power spectrogram built on FFmpeg's real FFT
//          (libavutil/tx.h).
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SCORING_STFT_HPP_
#define NARROVAULT_SCORING_STFT_HPP_

#include <cstddef>
#include <string>
#include <vector>

struct AVTXContext;

namespace narrovault::scoring {

// One analysis instance per thread; the FFT context is not shareable.
class Stft {
 public:
  Stft(int n_fft, int hop);
  ~Stft();

  Stft(const Stft&) = delete;
  Stft& operator=(const Stft&) = delete;

  int n_fft() const { return n_fft_; }
  int hop() const { return hop_; }
  int bins() const { return n_fft_ / 2 + 1; }

  // Power spectrum |X|^2 per frame (frames x bins). Frames start at 0 and
  // advance by hop while a full window fits; fewer than n_fft samples give
  // zero frames. Returns false with *error set if the FFT cannot be set up.
  bool PowerFrames(const std::vector<float>& samples,
                   std::vector<std::vector<float>>* frames,
                   std::string* error);

 private:
  int n_fft_;
  int hop_;
  std::vector<float> window_;
  AVTXContext* tx_ctx_ = nullptr;
  void (*tx_fn_)(AVTXContext*, void*, void*, ptrdiff_t) = nullptr;
  int init_error_ = 0;
};

}  // namespace narrovault::scoring

#endif  // NARROVAULT_SCORING_STFT_HPP_
