// Repository: NarroVault
// Component: QA gates
// Purpose: Automated checks on an assembled session before it may ship.
// Copyright (c) 2026 NarroVault

#include "narrovault/assembly/QaGates.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

#include "narrovault/audio/AudioDecoder.hpp"
#include "narrovault/util/JsonLine.hpp"
#include "narrovault/util/Logger.hpp"

namespace narrovault::assembly {

using narrovault::util::Logger;

namespace {

std::string Fixed(double v, int precision = 2) {
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(precision);
  oss << v;
  return oss.str();
}

QaGateResult Pass(const std::string& name, const std::string& detail = "") {
  return QaGateResult{name, true, false, detail};
}

QaGateResult Fail(const std::string& name, const std::string& detail) {
  return QaGateResult{name, false, false, detail};
}

QaGateResult Skip(const std::string& name, const std::string& detail) {
  return QaGateResult{name, true, true, detail};
}

// Interior of a silence segment clipped to the buffer, guard removed at each
// end. Empty when the segment is shorter than both guards.
bool SilenceInterior(const TimelineSegment& seg, size_t buffer_size, size_t guard,
                     size_t* begin, size_t* end) {
  size_t b = seg.start_sample + guard;
  size_t e = seg.end_sample > guard ? seg.end_sample - guard : 0;
  e = std::min(e, buffer_size);
  if (b >= e) return false;
  *begin = b;
  *end = e;
  return true;
}

double Median(std::vector<double> values) {
  if (values.empty()) return 0.0;
  const size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  double m = values[mid];
  if (values.size() % 2 == 0) {
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    m = (m + lower) / 2.0;
  }
  return m;
}

struct BandWindow {
  size_t start = 0;
  double total_ms = 0.0;  // mean square of the full-band signal
  double band_ms = 0.0;   // mean square of the high-passed signal
  bool speech = false;
};

bool StartsInSpeech(const Timeline& timeline, size_t sample) {
  for (const auto& seg : timeline) {
    if (seg.kind == SegmentKind::kSpeech && sample >= seg.start_sample &&
        sample < seg.end_sample) {
      return true;
    }
  }
  return false;
}

// Full windows only; a tail shorter than one window is not analysed.
std::vector<BandWindow> BandWindows(const audio::PcmBuffer& pcm, const std::vector<double>& band,
                                    const Timeline& timeline, double window_s, double hop_s) {
  std::vector<BandWindow> out;
  const size_t win = audio::PcmBuffer::SamplesFor(window_s, pcm.sample_rate);
  const size_t hop = audio::PcmBuffer::SamplesFor(hop_s, pcm.sample_rate);
  if (win == 0 || hop == 0) return out;
  for (size_t start = 0; start + win < pcm.size(); start += hop) {
    BandWindow w;
    w.start = start;
    for (size_t i = start; i < start + win; ++i) {
      const double x = pcm.samples[i];
      w.total_ms += x * x;
      w.band_ms += band[i] * band[i];
    }
    w.total_ms /= static_cast<double>(win);
    w.band_ms /= static_cast<double>(win);
    w.speech = StartsInSpeech(timeline, start);
    out.push_back(w);
  }
  return out;
}

std::string FirstAt(size_t sample, int sample_rate) {
  return " first_at=" + Fixed(static_cast<double>(sample) / sample_rate, 1) + "s";
}

}  // namespace

std::vector<std::string> QaReport::FailedGates() const {
  std::vector<std::string> out;
  for (const auto& g : gates) {
    if (!g.passed) out.push_back(g.name);
  }
  return out;
}

std::string QaReport::ToJson() const {
  std::vector<std::string> items;
  for (const auto& g : gates) {
    util::JsonObjectWriter w;
    w.Add("name", g.name).AddBool("passed", g.passed).AddBool("skipped", g.skipped)
        .Add("detail", g.detail);
    items.push_back(w.str());
  }
  util::JsonObjectWriter w;
  w.AddBool("passed", passed)
      .AddDouble("final_duration_s", final_duration_s)
      .AddDouble("integrated_lufs", final_loudness.integrated_lufs)
      .AddDouble("loudness_range_lu", final_loudness.loudness_range_lu)
      .AddDouble("true_peak_dbtp", final_loudness.true_peak_dbtp)
      .AddRaw("gates", util::JsonArray(items));
  return w.str();
}

QaGates::QaGates(QaConfig config) : config_(config) {}

QaReport QaGates::Run(const QaInput& input) const {
  QaReport report;
  const Timeline empty_timeline;
  const Timeline& timeline = input.timeline ? *input.timeline : empty_timeline;
  const double expected_s = timeline.empty() ? 0.0 : timeline.back().end_s;

  audio::AudioDecoder decoder;
  audio::PcmBuffer final_pcm;
  std::string error;
  const bool decoded = decoder.DecodeFile(input.final_wav_path, &final_pcm, &error);

  // ---- decodable ------------------------------------------------------------
  if (!decoded) {
    report.gates.push_back(Fail("decodable", "decode failed: " + error));
  } else {
    report.final_duration_s = final_pcm.DurationSeconds();
    const double diff = std::fabs(report.final_duration_s - expected_s);
    const std::string detail = "duration=" + Fixed(report.final_duration_s, 3) +
                               "s expected=" + Fixed(expected_s, 3) + "s";
    report.gates.push_back(diff <= config_.duration_tolerance_s ? Pass("decodable", detail)
                                                                : Fail("decodable", detail));
  }

  if (decoded) {
    report.final_loudness = audio::MeasureLoudness(final_pcm);
    report.gates.push_back(CheckClicksInSilence(final_pcm, timeline));
    report.gates.push_back(CheckSilenceIntegrity(final_pcm, timeline));
    report.gates.push_back(CheckLoudnessConsistency(final_pcm, timeline));
    report.gates.push_back(CheckSpectralComparison(final_pcm, timeline));
    report.gates.push_back(CheckEnergySpikes(final_pcm, timeline));
  } else {
    for (const char* name : {"clicks_in_silence", "silence_integrity", "loudness_consistency",
                             "spectral_comparison", "energy_spike"}) {
      report.gates.push_back(Fail(name, "final artifact not decodable"));
    }
  }

  if (input.raw) {
    report.gates.push_back(CheckSurgeDrop(*input.raw, timeline));
  } else {
    report.gates.push_back(Skip("surge_drop", "no raw concatenation"));
  }

  if (input.chunk_characters) {
    report.gates.push_back(CheckSpeechRate(timeline, *input.chunk_characters));
  } else {
    report.gates.push_back(Skip("speech_rate", "no character counts"));
  }

  // ---- integrated_loudness / true_peak --------------------------------------
  if (decoded) {
    const double lufs = report.final_loudness.integrated_lufs;
    const std::string lufs_detail =
        "integrated=" + Fixed(lufs) + "LUFS target=" + Fixed(input.target_lufs) + "LUFS";
    if (std::isfinite(lufs) &&
        std::fabs(lufs - input.target_lufs) <= config_.loudness_tolerance_lu) {
      report.gates.push_back(Pass("integrated_loudness", lufs_detail));
    } else {
      report.gates.push_back(Fail("integrated_loudness", lufs_detail));
    }

    const double tp = report.final_loudness.true_peak_dbtp;
    const std::string tp_detail =
        "true_peak=" + Fixed(tp) + "dBTP ceiling=" + Fixed(input.true_peak_ceiling_dbtp) + "dBTP";
    if (tp <= input.true_peak_ceiling_dbtp + config_.true_peak_tolerance_db) {
      report.gates.push_back(Pass("true_peak", tp_detail));
    } else {
      report.gates.push_back(Fail("true_peak", tp_detail));
    }
  } else {
    report.gates.push_back(Fail("integrated_loudness", "final artifact not decodable"));
    report.gates.push_back(Fail("true_peak", "final artifact not decodable"));
  }

  // ---- target_duration ------------------------------------------------------
  if (!input.target_duration_s || *input.target_duration_s <= 0.0) {
    report.gates.push_back(Skip("target_duration", "no target duration"));
  } else {
    const double target = *input.target_duration_s;
    const double actual = decoded ? report.final_duration_s : expected_s;
    const double deviation = std::fabs(actual - target) / target;
    const std::string detail = "duration=" + Fixed(actual, 1) + "s target=" + Fixed(target, 1) +
                               "s deviation=" + Fixed(deviation * 100.0, 1) + "%";
    report.gates.push_back(deviation <= config_.target_duration_tolerance
                               ? Pass("target_duration", detail)
                               : Fail("target_duration", detail));
  }

  for (const auto& g : report.gates) {
    if (!g.passed) report.passed = false;
    std::ostringstream line;
    line << "[QaGates] GATE name=" << g.name
         << " result=" << (g.skipped ? "SKIPPED" : (g.passed ? "PASS" : "FAIL"));
    if (!g.detail.empty()) line << " " << g.detail;
    if (g.passed) {
      Logger::Info(line.str());
    } else {
      Logger::Warn(line.str());
    }
  }
  return report;
}

QaGateResult QaGates::CheckClicksInSilence(const audio::PcmBuffer& pcm,
                                           const Timeline& timeline) const {
  const size_t guard = audio::PcmBuffer::SamplesFor(config_.guard_ms / 1000.0, pcm.sample_rate);
  int clicks = 0;
  std::string first;
  for (const auto& seg : timeline) {
    if (seg.kind != SegmentKind::kSilence) continue;
    size_t b = 0, e = 0;
    if (!SilenceInterior(seg, pcm.size(), guard, &b, &e)) continue;
    for (size_t n = b + 1; n < e; ++n) {
      if (std::fabs(pcm.samples[n] - pcm.samples[n - 1]) > config_.click_jump_threshold) {
        if (clicks == 0) {
          first = " first_at=" + Fixed(static_cast<double>(n) / pcm.sample_rate, 3) + "s";
        }
        ++clicks;
      }
    }
  }
  const std::string detail = "clicks=" + std::to_string(clicks) + first;
  return clicks == 0 ? Pass("clicks_in_silence", detail) : Fail("clicks_in_silence", detail);
}

QaGateResult QaGates::CheckSilenceIntegrity(const audio::PcmBuffer& pcm,
                                            const Timeline& timeline) const {
  const size_t guard = audio::PcmBuffer::SamplesFor(config_.guard_ms / 1000.0, pcm.sample_rate);
  int checked = 0;
  for (const auto& seg : timeline) {
    if (seg.kind != SegmentKind::kSilence) continue;
    size_t b = 0, e = 0;
    if (!SilenceInterior(seg, pcm.size(), guard, &b, &e)) continue;
    ++checked;
    const double level = audio::RmsDbfs(pcm.samples, b, e - b);
    if (level > config_.silence_max_dbfs) {
      return Fail("silence_integrity", "after_chunk=" + std::to_string(seg.chunk_index) +
                                           " rms=" + Fixed(level) + "dBFS limit=" +
                                           Fixed(config_.silence_max_dbfs) + "dBFS");
    }
  }
  if (checked == 0) return Skip("silence_integrity", "no silence regions");
  return Pass("silence_integrity", "regions=" + std::to_string(checked));
}

std::vector<double> QaGates::SpeechWindowLevels(const audio::PcmBuffer& pcm,
                                                const Timeline& timeline) const {
  const size_t window = audio::PcmBuffer::SamplesFor(config_.window_s, pcm.sample_rate);
  const size_t min_window = audio::PcmBuffer::SamplesFor(config_.min_window_s, pcm.sample_rate);
  std::vector<double> levels;
  if (window == 0) return levels;
  for (const auto& seg : timeline) {
    if (seg.kind != SegmentKind::kSpeech) continue;
    const size_t end = std::min(seg.end_sample, pcm.size());
    for (size_t b = seg.start_sample; b < end; b += window) {
      const size_t len = std::min(window, end - b);
      if (len < min_window) break;
      const double level = audio::RmsDbfs(pcm.samples, b, len);
      if (std::isfinite(level)) levels.push_back(level);
    }
  }
  return levels;
}

QaGateResult QaGates::CheckLoudnessConsistency(const audio::PcmBuffer& pcm,
                                               const Timeline& timeline) const {
  const std::vector<double> levels = SpeechWindowLevels(pcm, timeline);
  if (levels.empty()) return Skip("loudness_consistency", "no speech windows");
  const double median = Median(levels);
  int loud = 0;
  double worst = 0.0;
  for (double l : levels) {
    const double above = l - median;
    if (above > config_.consistency_max_above_median_db) ++loud;
    worst = std::max(worst, above);
  }
  const std::string detail = "windows=" + std::to_string(levels.size()) +
                             " median=" + Fixed(median) + "dBFS max_above=" + Fixed(worst) +
                             "dB outliers=" + std::to_string(loud);
  return loud == 0 ? Pass("loudness_consistency", detail) : Fail("loudness_consistency", detail);
}

QaGateResult QaGates::CheckSurgeDrop(const audio::PcmBuffer& pcm, const Timeline& timeline) const {
  const std::vector<double> levels = SpeechWindowLevels(pcm, timeline);
  if (levels.size() < 2) return Skip("surge_drop", "fewer than two speech windows");
  int surges = 0;
  int drops = 0;
  for (size_t i = 1; i < levels.size(); ++i) {
    const double delta = levels[i] - levels[i - 1];
    if (delta > config_.surge_max_db) ++surges;
    if (-delta > config_.drop_max_db) ++drops;
  }
  const std::string detail = "windows=" + std::to_string(levels.size()) +
                             " surges=" + std::to_string(surges) +
                             " drops=" + std::to_string(drops);
  return surges == 0 && drops == 0 ? Pass("surge_drop", detail) : Fail("surge_drop", detail);
}

QaGateResult QaGates::CheckEnergySpikes(const audio::PcmBuffer& pcm,
                                        const Timeline& timeline) const {
  const std::vector<double> band = audio::HighPass(pcm, config_.spike_cutoff_hz);
  const std::vector<BandWindow> windows =
      BandWindows(pcm, band, timeline, config_.analysis_window_s, config_.analysis_hop_s);

  std::vector<double> speech_total;
  std::vector<double> speech_band;
  for (const auto& w : windows) {
    if (!w.speech) continue;
    if (w.total_ms > 0.0) speech_total.push_back(w.total_ms);
    if (w.band_ms > 0.0) speech_band.push_back(w.band_ms);
  }
  if (speech_total.empty()) return Skip("energy_spike", "no speech windows");

  const double median_total = Median(speech_total);
  const double median_band = Median(speech_band);
  const double band_floor = std::pow(10.0, config_.band_floor_dbfs / 10.0);
  int spikes = 0;
  std::string first;
  for (const auto& w : windows) {
    const bool total_spike = w.total_ms / median_total > config_.spike_total_ratio;
    const bool band_spike = median_band > 0.0 && w.band_ms > band_floor &&
                            w.band_ms / median_band > config_.spike_band_ratio;
    if (!total_spike && !band_spike) continue;
    if (spikes == 0) first = FirstAt(w.start, pcm.sample_rate);
    ++spikes;
  }
  const std::string detail =
      "windows=" + std::to_string(windows.size()) + " spikes=" + std::to_string(spikes) + first;
  return spikes == 0 ? Pass("energy_spike", detail) : Fail("energy_spike", detail);
}

QaGateResult QaGates::CheckSpectralComparison(const audio::PcmBuffer& pcm,
                                              const Timeline& timeline) const {
  const std::vector<double> band = audio::HighPass(pcm, config_.spectral_cutoff_hz);
  const std::vector<BandWindow> windows =
      BandWindows(pcm, band, timeline, config_.analysis_window_s, config_.analysis_hop_s);

  std::vector<double> levels;
  levels.reserve(windows.size());
  std::vector<double> speech_levels;
  for (const auto& w : windows) {
    const double db = w.band_ms > 0.0 ? 10.0 * std::log10(w.band_ms) : -100.0;
    levels.push_back(db);
    if (w.speech) speech_levels.push_back(db);
  }
  if (static_cast<int>(speech_levels.size()) < config_.spectral_min_speech_windows) {
    return Skip("spectral_comparison",
                "speech_windows=" + std::to_string(speech_levels.size()));
  }

  const double median = Median(speech_levels);
  int flagged = 0;
  double worst = 0.0;
  std::string first;
  for (size_t i = 0; i < windows.size(); ++i) {
    if (!windows[i].speech) continue;
    const double deviation = levels[i] - median;
    worst = std::max(worst, deviation);
    if (deviation <= config_.spectral_max_deviation_db || levels[i] <= config_.band_floor_dbfs) {
      continue;
    }
    if (flagged == 0) first = FirstAt(windows[i].start, pcm.sample_rate);
    ++flagged;
  }
  const std::string detail = "speech_windows=" + std::to_string(speech_levels.size()) +
                             " median_hf=" + Fixed(median, 1) + "dB max_deviation=" +
                             Fixed(worst, 1) + "dB flagged=" + std::to_string(flagged) + first;
  return flagged == 0 ? Pass("spectral_comparison", detail)
                      : Fail("spectral_comparison", detail);
}

QaGateResult QaGates::CheckSpeechRate(const Timeline& timeline,
                                      const std::map<int, int>& chunk_characters) const {
  std::vector<std::pair<int, double>> rates;  // chunk_index, characters per second
  for (const auto& seg : timeline) {
    if (seg.kind != SegmentKind::kSpeech) continue;
    const double seconds = seg.duration_s();
    if (seconds < config_.min_rate_segment_s) continue;
    auto it = chunk_characters.find(seg.chunk_index);
    if (it == chunk_characters.end() || it->second <= 0) continue;
    rates.emplace_back(seg.chunk_index, it->second / seconds);
  }
  if (static_cast<int>(rates.size()) < config_.min_rate_segments) {
    return Skip("speech_rate", "segments=" + std::to_string(rates.size()));
  }

  std::vector<double> values;
  values.reserve(rates.size());
  for (const auto& r : rates) values.push_back(r.second);
  const double median = Median(values);
  const double threshold = std::max(median * config_.rush_ratio, config_.rush_floor_cps);

  int rushes = 0;
  std::string first;
  for (const auto& r : rates) {
    // Implausibly fast segments are alignment errors, not rushed reads.
    if (r.second > config_.implausible_rate_cps || r.second <= threshold) continue;
    if (rushes == 0) {
      first = " first_chunk=" + std::to_string(r.first) + " rate=" + Fixed(r.second, 1) + "cps";
    }
    ++rushes;
  }
  const std::string detail = "segments=" + std::to_string(rates.size()) +
                             " median=" + Fixed(median, 1) + "cps threshold=" +
                             Fixed(threshold, 1) + "cps rushes=" + std::to_string(rushes) + first;
  return rushes == 0 ? Pass("speech_rate", detail) : Fail("speech_rate", detail);
}

}  // namespace narrovault::assembly
