// Repository: NarroVault
// Component: Configuration
// Purpose: Top-level settings for the CLI and the session pipeline.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_CONFIG_VAULT_CONFIG_HPP_
#define NARROVAULT_CONFIG_VAULT_CONFIG_HPP_

#include <map>
#include <string>
#include <vector>

#include "narrovault/session/SessionPipeline.hpp"

namespace narrovault::config {

struct VaultConfig {
  std::string vault_dir = "vault";
  // gRPC target of the synthesis service.
  std::string synth_target = "localhost:50061";
  // Each directory receives a full mirror of everything written.
  std::vector<std::string> backup_dirs;
  double prefilter_threshold = 0.30;
  // Prometheus text file written after each generation run (empty: off).
  std::string metrics_path;

  session::PipelineConfig pipeline;
};

// key=value lines; '#' starts a comment line; blank lines are ignored.
// Unknown keys and malformed values raise ConfigError naming the line.
class ConfigLoader {
 public:
  static VaultConfig LoadFile(const std::string& path, VaultConfig base = {});
  static VaultConfig LoadString(const std::string& text, VaultConfig base = {},
                                const std::string& origin = "<string>");

  // Sets one key. Throws ConfigError.
  static void Apply(VaultConfig& config, const std::string& key, const std::string& value);

  // NARROVAULT_VAULT_DIR, NARROVAULT_SYNTH_TARGET, NARROVAULT_MAX_CONCURRENT.
  static void ApplyEnvironment(VaultConfig& config);
  static void ApplyOverrides(VaultConfig& config, const std::map<std::string, std::string>& env);

  // Names accepted by Apply, sorted.
  static std::vector<std::string> Keys();
};

}  // namespace narrovault::config

#endif  // NARROVAULT_CONFIG_VAULT_CONFIG_HPP_
