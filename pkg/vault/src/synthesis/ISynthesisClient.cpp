// Repository: NarroVault
// Component: Synthesis client interface
// Purpose: Narrow seam to the external text-to-speech capability.
// Copyright (c) 2026 NarroVault

#include "narrovault/synthesis/ISynthesisClient.hpp"

namespace narrovault::synthesis {

const char* SynthesisStatusToString(SynthesisStatus status) {
  switch (status) {
    case SynthesisStatus::kOk: return "OK";
    case SynthesisStatus::kThrottled: return "THROTTLED";
    case SynthesisStatus::kTransient: return "TRANSIENT";
    case SynthesisStatus::kTimeout: return "TIMEOUT";
    case SynthesisStatus::kRejected: return "REJECTED";
  }
  return "UNKNOWN";
}

}  // namespace narrovault::synthesis
