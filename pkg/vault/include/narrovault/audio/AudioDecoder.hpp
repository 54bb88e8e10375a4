// Repository: NarroVault
// Component: Audio Decoder
// Purpose: FFmpeg-based decoding of synthesized audio bytes and vault files
//          into mono float PCM at the vault sample rate.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_AUDIO_DECODER_HPP_
#define NARROVAULT_AUDIO_AUDIO_DECODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::audio {

// Stateless decoder: every call opens its own FFmpeg contexts, so one
// instance can be shared by all generation workers.
//
// Any container/codec FFmpeg can open is accepted (WAV, MP3, ...). Output is
// downmixed to mono and resampled to target_sample_rate.
class AudioDecoder {
 public:
  explicit AudioDecoder(int target_sample_rate = kVaultSampleRate);

  // Returns false and sets *error if the bytes cannot be decoded.
  bool DecodeMemory(const std::vector<uint8_t>& bytes, PcmBuffer* out,
                    std::string* error) const;

  bool DecodeFile(const std::string& path, PcmBuffer* out, std::string* error) const;

  int target_sample_rate() const { return target_sample_rate_; }

 private:
  int target_sample_rate_;
};

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_AUDIO_DECODER_HPP_
