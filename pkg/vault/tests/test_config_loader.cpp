// Repository: NarroVault
// Component: Configuration tests
// Purpose: key=value parsing, line-numbered errors and environment overrides.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <string>

#include "TempVault.hpp"
#include "narrovault/config/VaultConfig.hpp"
#include "narrovault/util/VaultError.hpp"

namespace narrovault::config {
namespace {

TEST(ConfigLoaderTest, ParsesEverySection) {
  const std::string text =
      "# production vault\n"
      "vault_dir = /srv/narration/vault\n"
      "backup_dir = /mnt/backup-a\n"
      "backup_dir = /mnt/backup-b\n"
      "\n"
      "workers = 8\n"
      "max_concurrent_calls = 4\n"
      "retry.max_attempts = 6\n"
      "lock_policy = block\n"
      "voice.id = narrator-warm\n"
      "assembly.target_lufs = -24\n"
      "assembly.humanize_pauses = no\n"
      "qa.loudness_tolerance_lu = 1.5\n"
      "qa.rush_ratio = 1.4\n";

  const VaultConfig c = ConfigLoader::LoadString(text);
  EXPECT_EQ(c.vault_dir, "/srv/narration/vault");
  EXPECT_EQ(c.backup_dirs, (std::vector<std::string>{"/mnt/backup-a", "/mnt/backup-b"}));
  EXPECT_EQ(c.pipeline.orchestrator.workers, 8);
  EXPECT_EQ(c.pipeline.orchestrator.max_concurrent_calls, 4);
  EXPECT_EQ(c.pipeline.orchestrator.retry.max_attempts, 6);
  EXPECT_EQ(c.pipeline.lock_policy, vault::RunLockPolicy::kBlock);
  EXPECT_EQ(c.pipeline.orchestrator.voice.voice_id, "narrator-warm");
  EXPECT_DOUBLE_EQ(c.pipeline.assembly.target_lufs, -24.0);
  EXPECT_FALSE(c.pipeline.assembly.humanize_pauses);
  EXPECT_DOUBLE_EQ(c.pipeline.qa.loudness_tolerance_lu, 1.5);
  EXPECT_DOUBLE_EQ(c.pipeline.qa.rush_ratio, 1.4);
}

TEST(ConfigLoaderTest, UnsetKeysKeepTheBase) {
  VaultConfig base;
  base.synth_target = "synth.internal:443";
  const VaultConfig c = ConfigLoader::LoadString("workers = 2\n", base);
  EXPECT_EQ(c.synth_target, "synth.internal:443");
  EXPECT_EQ(c.pipeline.orchestrator.workers, 2);
}

TEST(ConfigLoaderTest, ErrorsNameOriginAndLine) {
  try {
    ConfigLoader::LoadString("workers = 2\n\nworkers = many\n", {}, "vault.conf");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("vault.conf:3"), std::string::npos) << what;
    EXPECT_NE(what.find("workers"), std::string::npos) << what;
  }
}

TEST(ConfigLoaderTest, RejectsUnknownKeysAndMalformedLines) {
  EXPECT_THROW(ConfigLoader::LoadString("colour = blue\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("just some words\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("workers = 0\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("retry.base_delay_ms = -5\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("lock_policy = sometimes\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("require_vault_ready = maybe\n"), ConfigError);
  EXPECT_THROW(ConfigLoader::LoadString("prefilter_threshold = 0.3x\n"), ConfigError);
}

TEST(ConfigLoaderTest, OverridesWinOverTheFile) {
  VaultConfig c = ConfigLoader::LoadString("vault_dir = from-file\nmax_concurrent_calls = 2\n");
  ConfigLoader::ApplyOverrides(c, {{"NARROVAULT_VAULT_DIR", "from-env"},
                                   {"NARROVAULT_MAX_CONCURRENT", "9"},
                                   {"NARROVAULT_SYNTH_TARGET", ""}});
  EXPECT_EQ(c.vault_dir, "from-env");
  EXPECT_EQ(c.pipeline.orchestrator.max_concurrent_calls, 9);
  // Empty values are ignored.
  EXPECT_EQ(c.synth_target, VaultConfig{}.synth_target);

  EXPECT_THROW(ConfigLoader::ApplyOverrides(c, {{"NARROVAULT_MAX_CONCURRENT", "lots"}}),
               ConfigError);
}

TEST(ConfigLoaderTest, LoadsFromFile) {
  test_infra::TempDir dir("config");
  const std::string path = dir.path() + "/vault.conf";
  {
    std::ofstream out(path);
    out << "synth_target = 10.0.0.5:50061\nchunk.min_chars = 12\n";
  }
  const VaultConfig c = ConfigLoader::LoadFile(path);
  EXPECT_EQ(c.synth_target, "10.0.0.5:50061");
  EXPECT_EQ(c.pipeline.chunk_policy.min_chars, 12);

  EXPECT_THROW(ConfigLoader::LoadFile(dir.path() + "/missing.conf"), ConfigError);
}

TEST(ConfigLoaderTest, KeysAreSortedAndSettable) {
  const auto keys = ConfigLoader::Keys();
  ASSERT_FALSE(keys.empty());
  EXPECT_TRUE(std::is_sorted(keys.begin(), keys.end()));
  for (const char* k : {"vault_dir", "retry.max_delay_ms", "qa.silence_max_dbfs"}) {
    EXPECT_TRUE(std::binary_search(keys.begin(), keys.end(), std::string(k))) << k;
  }
}

}  // namespace
}  // namespace narrovault::config
