// Repository: NarroVault
// Component: Audio Encoder
// Purpose: FFmpeg-based writing of mono PCM to lossless WAV (PCM S16LE) and
//          compressed MP3 artifacts.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_AUDIO_AUDIO_ENCODER_HPP_
#define NARROVAULT_AUDIO_AUDIO_ENCODER_HPP_

#include <string>

#include "narrovault/audio/PcmBuffer.hpp"

namespace narrovault::audio {

enum class AudioContainer {
  kWavPcm16,  // lossless vault format
  kMp3,       // libmp3lame deliverable
};

const char* AudioContainerToString(AudioContainer container);

struct EncodeSettings {
  AudioContainer container = AudioContainer::kWavPcm16;
  int bit_rate = 128000;  // compressed containers only
};

// Muxing runs with AVFMT_FLAG_BITEXACT and AV_CODEC_FLAG_BITEXACT so that the
// same samples always produce the same WAV bytes.
class AudioEncoder {
 public:
  // Writes pcm to path (created or truncated). Returns false and sets *error
  // on failure; a partially written file may remain and is the caller's to
  // discard.
  bool WriteFile(const PcmBuffer& pcm, const std::string& path,
                 const EncodeSettings& settings, std::string* error) const;
};

}  // namespace narrovault::audio

#endif  // NARROVAULT_AUDIO_AUDIO_ENCODER_HPP_
