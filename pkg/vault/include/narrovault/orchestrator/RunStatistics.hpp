// Repository: NarroVault
// Component: Generation run statistics
// Purpose: Passive counters for one orchestrator run
// Copyright (c) 2026 NarroVault
//
// These counters are observations only. They do not affect dispatch, retry
// or commit decisions.

#ifndef NARROVAULT_ORCHESTRATOR_RUN_STATISTICS_HPP_
#define NARROVAULT_ORCHESTRATOR_RUN_STATISTICS_HPP_

#include <cstdint>
#include <sstream>
#include <string>

namespace narrovault::orchestrator {

// =============================================================================
// RunStatistics
// Accumulated by the orchestrator under its stats mutex; callers receive a
// copy in the RunSummary.
// =============================================================================

struct RunStatistics {
  std::string session_id;

  // ---- Work units ----
  uint64_t slots_requested = 0;
  uint64_t candidates_written = 0;
  uint64_t candidates_below_prefilter = 0;
  uint64_t slots_failed = 0;
  uint64_t slots_cancelled = 0;

  // ---- External calls ----
  uint64_t attempts_total = 0;
  uint64_t throttled = 0;           // attempts answered with a rate-limit signal
  uint64_t transient_errors = 0;    // network / server errors
  uint64_t timeouts = 0;
  uint64_t rejected = 0;            // non-retryable
  uint64_t retries = 0;             // attempts after the first per slot
  uint64_t decode_failures = 0;
  int peak_in_flight = 0;
  int64_t max_call_ms = 0;
  int64_t sum_call_ms = 0;
  int64_t total_backoff_ms = 0;

  // ---- Characters / cost ----
  uint64_t attempted_characters = 0;
  uint64_t billed_characters = 0;
  double cost_estimate_usd = 0.0;

  // ---- Wall clock ----
  int64_t wall_ms = 0;
  bool cancelled = false;

  uint64_t ErrorCount() const {
    return transient_errors + timeouts + rejected + decode_failures;
  }

  // Prometheus text exposition format.
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;
    const std::string label = "{session=\"" + session_id + "\"}";

    oss << "# HELP narrovault_generation_slots_requested_total Candidate slots requested\n";
    oss << "# TYPE narrovault_generation_slots_requested_total counter\n";
    oss << "narrovault_generation_slots_requested_total" << label << " " << slots_requested << "\n";

    oss << "\n# HELP narrovault_generation_candidates_written_total Candidates committed to the vault\n";
    oss << "# TYPE narrovault_generation_candidates_written_total counter\n";
    oss << "narrovault_generation_candidates_written_total" << label << " "
        << candidates_written << "\n";

    oss << "\n# HELP narrovault_generation_candidates_below_prefilter_total Committed candidates flagged by the pre-filter\n";
    oss << "# TYPE narrovault_generation_candidates_below_prefilter_total counter\n";
    oss << "narrovault_generation_candidates_below_prefilter_total" << label << " "
        << candidates_below_prefilter << "\n";

    oss << "\n# HELP narrovault_generation_slots_failed_total Slots that ended without a candidate\n";
    oss << "# TYPE narrovault_generation_slots_failed_total counter\n";
    oss << "narrovault_generation_slots_failed_total" << label << " " << slots_failed << "\n";

    oss << "\n# HELP narrovault_synthesis_attempts_total External call attempts\n";
    oss << "# TYPE narrovault_synthesis_attempts_total counter\n";
    oss << "narrovault_synthesis_attempts_total" << label << " " << attempts_total << "\n";

    oss << "\n# HELP narrovault_synthesis_throttled_total Attempts answered with a rate-limit signal\n";
    oss << "# TYPE narrovault_synthesis_throttled_total counter\n";
    oss << "narrovault_synthesis_throttled_total" << label << " " << throttled << "\n";

    oss << "\n# HELP narrovault_synthesis_errors_total Failed attempts by class\n";
    oss << "# TYPE narrovault_synthesis_errors_total counter\n";
    oss << "narrovault_synthesis_errors_total{session=\"" << session_id
        << "\",class=\"transient\"} " << transient_errors << "\n";
    oss << "narrovault_synthesis_errors_total{session=\"" << session_id
        << "\",class=\"timeout\"} " << timeouts << "\n";
    oss << "narrovault_synthesis_errors_total{session=\"" << session_id
        << "\",class=\"rejected\"} " << rejected << "\n";
    oss << "narrovault_synthesis_errors_total{session=\"" << session_id
        << "\",class=\"decode\"} " << decode_failures << "\n";

    oss << "\n# HELP narrovault_synthesis_retries_total Retried attempts\n";
    oss << "# TYPE narrovault_synthesis_retries_total counter\n";
    oss << "narrovault_synthesis_retries_total" << label << " " << retries << "\n";

    oss << "\n# HELP narrovault_synthesis_peak_in_flight Peak concurrent external calls\n";
    oss << "# TYPE narrovault_synthesis_peak_in_flight gauge\n";
    oss << "narrovault_synthesis_peak_in_flight" << label << " " << peak_in_flight << "\n";

    oss << "\n# HELP narrovault_synthesis_max_call_ms Slowest external call (ms)\n";
    oss << "# TYPE narrovault_synthesis_max_call_ms gauge\n";
    oss << "narrovault_synthesis_max_call_ms" << label << " " << max_call_ms << "\n";

    double mean_call = attempts_total > 0
        ? static_cast<double>(sum_call_ms) / static_cast<double>(attempts_total)
        : 0.0;
    oss << "\n# HELP narrovault_synthesis_mean_call_ms Mean external call duration (ms)\n";
    oss << "# TYPE narrovault_synthesis_mean_call_ms gauge\n";
    oss << "narrovault_synthesis_mean_call_ms" << label << " " << static_cast<int64_t>(mean_call)
        << "\n";

    oss << "\n# HELP narrovault_synthesis_backoff_ms_total Time spent waiting before retries (ms)\n";
    oss << "# TYPE narrovault_synthesis_backoff_ms_total counter\n";
    oss << "narrovault_synthesis_backoff_ms_total" << label << " " << total_backoff_ms << "\n";

    oss << "\n# HELP narrovault_synthesis_characters_total Characters sent, attempted vs billed\n";
    oss << "# TYPE narrovault_synthesis_characters_total counter\n";
    oss << "narrovault_synthesis_characters_total{session=\"" << session_id
        << "\",kind=\"attempted\"} " << attempted_characters << "\n";
    oss << "narrovault_synthesis_characters_total{session=\"" << session_id
        << "\",kind=\"billed\"} " << billed_characters << "\n";

    oss << "\n# HELP narrovault_generation_wall_ms Wall-clock duration of the run (ms)\n";
    oss << "# TYPE narrovault_generation_wall_ms gauge\n";
    oss << "narrovault_generation_wall_ms" << label << " " << wall_ms << "\n";

    oss << "\n# HELP narrovault_generation_cancelled Whether the run was cancelled\n";
    oss << "# TYPE narrovault_generation_cancelled gauge\n";
    oss << "narrovault_generation_cancelled" << label << " " << (cancelled ? 1 : 0) << "\n";

    return oss.str();
  }
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_RUN_STATISTICS_HPP_
