// Repository: NarroVault
// Component: Configuration
// Purpose: key=value configuration files and environment overrides.
// Copyright (c) 2026 NarroVault

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>

#include "narrovault/config/VaultConfig.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::config {

namespace {

using Setter = std::function<void(VaultConfig&, const std::string&)>;

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  const size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

int64_t ParseInt(const std::string& key, const std::string& value) {
  if (value.empty()) throw ConfigError("config: empty value for " + key);
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    throw ConfigError("config: " + key + " expects an integer, got '" + value + "'");
  }
  return v;
}

int ParsePositiveInt(const std::string& key, const std::string& value) {
  const int64_t v = ParseInt(key, value);
  if (v < 1 || v > 1000000) {
    throw ConfigError("config: " + key + " must be a positive integer, got '" + value + "'");
  }
  return static_cast<int>(v);
}

int ParseNonNegativeInt(const std::string& key, const std::string& value) {
  const int64_t v = ParseInt(key, value);
  if (v < 0 || v > 1000000) {
    throw ConfigError("config: " + key + " must be >= 0, got '" + value + "'");
  }
  return static_cast<int>(v);
}

double ParseDouble(const std::string& key, const std::string& value) {
  if (value.empty()) throw ConfigError("config: empty value for " + key);
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(value.c_str(), &end);
  if (errno != 0 || end == value.c_str() || *end != '\0') {
    throw ConfigError("config: " + key + " expects a number, got '" + value + "'");
  }
  return v;
}

bool ParseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "no") return false;
  throw ConfigError("config: " + key + " expects true/false, got '" + value + "'");
}

const std::map<std::string, Setter>& Setters() {
  static const std::map<std::string, Setter> kSetters = {
      // ---- vault ----
      {"vault_dir", [](VaultConfig& c, const std::string& v) { c.vault_dir = v; }},
      {"synth_target", [](VaultConfig& c, const std::string& v) { c.synth_target = v; }},
      {"backup_dir", [](VaultConfig& c, const std::string& v) { c.backup_dirs.push_back(v); }},
      {"metrics_path", [](VaultConfig& c, const std::string& v) { c.metrics_path = v; }},
      {"prefilter_threshold",
       [](VaultConfig& c, const std::string& v) {
         c.prefilter_threshold = ParseDouble("prefilter_threshold", v);
       }},
      {"lock_policy",
       [](VaultConfig& c, const std::string& v) {
         if (v == "reject") {
           c.pipeline.lock_policy = vault::RunLockPolicy::kReject;
         } else if (v == "block") {
           c.pipeline.lock_policy = vault::RunLockPolicy::kBlock;
         } else {
           throw ConfigError("config: lock_policy expects reject|block, got '" + v + "'");
         }
       }},
      {"require_vault_ready",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.require_vault_ready = ParseBool("require_vault_ready", v);
       }},

      // ---- orchestrator ----
      {"workers",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.workers = ParsePositiveInt("workers", v);
       }},
      {"max_concurrent_calls",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.max_concurrent_calls = ParsePositiveInt("max_concurrent_calls", v);
       }},
      {"call_timeout_ms",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.call_timeout =
             std::chrono::milliseconds(ParsePositiveInt("call_timeout_ms", v));
       }},
      {"jitter_seed",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.jitter_seed =
             static_cast<uint64_t>(ParseInt("jitter_seed", v));
       }},
      {"retry.max_attempts",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.retry.max_attempts = ParsePositiveInt("retry.max_attempts", v);
       }},
      {"retry.base_delay_ms",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.retry.base_delay_ms =
             ParseNonNegativeInt("retry.base_delay_ms", v);
       }},
      {"retry.max_delay_ms",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.retry.max_delay_ms = ParseNonNegativeInt("retry.max_delay_ms", v);
       }},
      {"cost.usd_per_1k_characters",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.cost.usd_per_1k_characters =
             ParseDouble("cost.usd_per_1k_characters", v);
       }},
      {"cost.bill_failed_attempts",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.cost.bill_failed_attempts =
             ParseBool("cost.bill_failed_attempts", v);
       }},
      {"overgeneration.chars_per_second",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.speech_chars_per_second =
             ParseDouble("overgeneration.chars_per_second", v);
       }},
      {"overgeneration.factor",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.overgeneration_factor = ParseDouble("overgeneration.factor", v);
       }},
      {"overgeneration.floor_s",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.overgeneration_floor_s = ParseDouble("overgeneration.floor_s", v);
       }},

      // ---- voice ----
      {"voice.id",
       [](VaultConfig& c, const std::string& v) { c.pipeline.orchestrator.voice.voice_id = v; }},
      {"voice.model_version",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.voice.model_version = v;
       }},
      {"voice.format",
       [](VaultConfig& c, const std::string& v) { c.pipeline.orchestrator.voice.format = v; }},
      {"voice.temperature",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.voice.temperature = ParseDouble("voice.temperature", v);
       }},
      {"voice.speed",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.voice.speed = ParseDouble("voice.speed", v);
       }},
      {"voice.sample_rate",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.orchestrator.voice.sample_rate = ParsePositiveInt("voice.sample_rate", v);
       }},

      // ---- candidate volume / chunk policy ----
      {"candidates.opening_max_chars",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.candidates.opening_max_chars =
             ParseNonNegativeInt("candidates.opening_max_chars", v);
       }},
      {"candidates.opening_count",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.candidates.opening_count = ParseNonNegativeInt("candidates.opening_count", v);
       }},
      {"candidates.fallback_count",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.candidates.fallback_count =
             ParseNonNegativeInt("candidates.fallback_count", v);
       }},
      {"chunk.min_chars",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.chunk_policy.min_chars = ParseNonNegativeInt("chunk.min_chars", v);
       }},
      {"chunk.max_chars",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.chunk_policy.max_chars = ParsePositiveInt("chunk.max_chars", v);
       }},
      {"chunk.opening_max_chars",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.chunk_policy.opening_max_chars =
             ParsePositiveInt("chunk.opening_max_chars", v);
       }},

      // ---- assembly ----
      {"assembly.fade_ms",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.fade_ms = ParseDouble("assembly.fade_ms", v);
       }},
      {"assembly.target_lufs",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.target_lufs = ParseDouble("assembly.target_lufs", v);
       }},
      {"assembly.true_peak_dbtp",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.true_peak_ceiling_dbtp = ParseDouble("assembly.true_peak_dbtp", v);
       }},
      {"assembly.target_lra_lu",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.target_lra_lu = ParseDouble("assembly.target_lra_lu", v);
       }},
      {"assembly.mp3_bit_rate",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.mp3_bit_rate = ParsePositiveInt("assembly.mp3_bit_rate", v);
       }},
      {"assembly.humanize_pauses",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.assembly.humanize_pauses = ParseBool("assembly.humanize_pauses", v);
       }},

      // ---- QA ----
      {"qa.loudness_tolerance_lu",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.loudness_tolerance_lu = ParseDouble("qa.loudness_tolerance_lu", v);
       }},
      {"qa.silence_max_dbfs",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.silence_max_dbfs = ParseDouble("qa.silence_max_dbfs", v);
       }},
      {"qa.target_duration_tolerance",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.target_duration_tolerance = ParseDouble("qa.target_duration_tolerance", v);
       }},
      {"qa.rush_ratio",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.rush_ratio = ParseDouble("qa.rush_ratio", v);
       }},
      {"qa.spike_total_ratio",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.spike_total_ratio = ParseDouble("qa.spike_total_ratio", v);
       }},
      {"qa.spectral_max_deviation_db",
       [](VaultConfig& c, const std::string& v) {
         c.pipeline.qa.spectral_max_deviation_db = ParseDouble("qa.spectral_max_deviation_db", v);
       }},
  };
  return kSetters;
}

}  // namespace

void ConfigLoader::Apply(VaultConfig& config, const std::string& key, const std::string& value) {
  const auto& setters = Setters();
  auto it = setters.find(key);
  if (it == setters.end()) throw ConfigError("config: unknown key '" + key + "'");
  it->second(config, value);
}

std::vector<std::string> ConfigLoader::Keys() {
  std::vector<std::string> keys;
  for (const auto& kv : Setters()) keys.push_back(kv.first);
  return keys;
}

VaultConfig ConfigLoader::LoadString(const std::string& text, VaultConfig base,
                                     const std::string& origin) {
  std::istringstream in(text);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;
    const size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      throw ConfigError(origin + ":" + std::to_string(line_no) + ": expected key=value");
    }
    const std::string key = Trim(trimmed.substr(0, eq));
    const std::string value = Trim(trimmed.substr(eq + 1));
    try {
      Apply(base, key, value);
    } catch (const ConfigError& e) {
      throw ConfigError(origin + ":" + std::to_string(line_no) + ": " + e.what());
    }
  }
  return base;
}

VaultConfig ConfigLoader::LoadFile(const std::string& path, VaultConfig base) {
  std::ifstream in(path);
  if (!in) throw ConfigError("config: cannot read " + path);
  std::ostringstream text;
  text << in.rdbuf();
  VaultConfig config = LoadString(text.str(), std::move(base), path);
  util::Logger::Info("[ConfigLoader] LOADED path=" + path);
  return config;
}

void ConfigLoader::ApplyOverrides(VaultConfig& config,
                                  const std::map<std::string, std::string>& env) {
  auto it = env.find("NARROVAULT_VAULT_DIR");
  if (it != env.end() && !it->second.empty()) config.vault_dir = it->second;
  it = env.find("NARROVAULT_SYNTH_TARGET");
  if (it != env.end() && !it->second.empty()) config.synth_target = it->second;
  it = env.find("NARROVAULT_MAX_CONCURRENT");
  if (it != env.end() && !it->second.empty()) {
    config.pipeline.orchestrator.max_concurrent_calls =
        ParsePositiveInt("NARROVAULT_MAX_CONCURRENT", it->second);
  }
}

void ConfigLoader::ApplyEnvironment(VaultConfig& config) {
  std::map<std::string, std::string> env;
  for (const char* name :
       {"NARROVAULT_VAULT_DIR", "NARROVAULT_SYNTH_TARGET", "NARROVAULT_MAX_CONCURRENT"}) {
    if (const char* v = std::getenv(name)) env[name] = v;
  }
  ApplyOverrides(config, env);
}

}  // namespace narrovault::config
