// Repository: NarroVault
// Component: Assembly types
// Purpose: Stage enum, segment timeline and configuration shared by the
//          assembly engine and the QA gates.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ASSEMBLY_ASSEMBLY_TYPES_HPP_
#define NARROVAULT_ASSEMBLY_ASSEMBLY_TYPES_HPP_

#include <cstddef>
#include <string>
#include <vector>

namespace narrovault::assembly {

// Stages run strictly in this order; a failure leaves the engine at the last
// completed stage.
enum class AssemblyStage {
  kNotStarted,
  kPicksLoaded,
  kFaded,
  kSilenceInserted,
  kConcatenated,
  kNormalized,
  kEncoded,
  kQaChecked,
};

const char* AssemblyStageToString(AssemblyStage stage);

enum class SegmentKind {
  kSpeech,
  kSilence,
};

const char* SegmentKindToString(SegmentKind kind);

// One contiguous region of the assembled file. Sample positions are at the
// vault sample rate; [start_sample, end_sample).
struct TimelineSegment {
  SegmentKind kind = SegmentKind::kSpeech;
  int chunk_index = 0;   // speech: the chunk; silence: the chunk it follows
  int version = -1;      // speech only
  size_t start_sample = 0;
  size_t end_sample = 0;
  double start_s = 0.0;
  double end_s = 0.0;

  size_t length() const { return end_sample - start_sample; }
  double duration_s() const { return end_s - start_s; }
};

using Timeline = std::vector<TimelineSegment>;

struct AssemblyConfig {
  double fade_ms = 15.0;

  // Whole-file normalization.
  double target_lufs = -26.0;
  double true_peak_ceiling_dbtp = -2.0;
  double target_lra_lu = 11.0;

  int mp3_bit_rate = 128000;
  bool humanize_pauses = true;
};

}  // namespace narrovault::assembly

#endif  // NARROVAULT_ASSEMBLY_ASSEMBLY_TYPES_HPP_
