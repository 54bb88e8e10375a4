// Repository: NarroVault
// Component: Synthesis client interface
// Purpose: Narrow seam to the external text-to-speech capability.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SYNTHESIS_ISYNTHESIS_CLIENT_HPP_
#define NARROVAULT_SYNTHESIS_ISYNTHESIS_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace narrovault::synthesis {

struct VoiceSettings {
  std::string voice_id;
  std::string model_version;
  std::string format = "wav";
  double temperature = 0.3;
  double speed = 0.95;
  int sample_rate = 44100;
};

struct SynthesisRequest {
  std::string call_id;
  int attempt = 1;
  std::string text;
  std::string emotion;
  VoiceSettings voice;
};

// Outcome classes that drive the retry policy.
enum class SynthesisStatus {
  kOk,
  kThrottled,    // rate limited; retry with backoff
  kTransient,    // network / server hiccup; retry with backoff
  kTimeout,      // call exceeded its deadline; retried like kTransient
  kRejected,     // malformed or refused request; never retried
};

const char* SynthesisStatusToString(SynthesisStatus status);

inline bool IsRetryable(SynthesisStatus status) {
  return status == SynthesisStatus::kThrottled || status == SynthesisStatus::kTransient ||
         status == SynthesisStatus::kTimeout;
}

struct SynthesisResponse {
  SynthesisStatus status = SynthesisStatus::kOk;
  std::vector<uint8_t> audio;
  std::string format;
  // 0 when the provider did not report billing.
  uint32_t billed_characters = 0;
  std::string detail;
};

// Implementations must be safe to call from several worker threads at once.
class ISynthesisClient {
 public:
  virtual ~ISynthesisClient() = default;
  virtual SynthesisResponse Synthesize(const SynthesisRequest& request,
                                       std::chrono::milliseconds timeout) = 0;
};

}  // namespace narrovault::synthesis

#endif  // NARROVAULT_SYNTHESIS_ISYNTHESIS_CLIENT_HPP_
