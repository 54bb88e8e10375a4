// Repository: NarroVault
// Component: Command-line front end
// Purpose: register / plan / generate / pick / assemble / status against a
//          vault directory and a gRPC synthesis service.
// Copyright (c) 2026 NarroVault
//
// SIGINT/SIGTERM during `generate` cancel the run between work units; every
// candidate already committed stays in the vault.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "narrovault/config/VaultConfig.hpp"
#include "narrovault/inventory/InventoryTypes.hpp"
#include "narrovault/session/SessionPipeline.hpp"
#include "narrovault/synthesis/GrpcSynthesisClient.hpp"
#include "narrovault/util/Logger.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/BackupMirror.hpp"
#include "narrovault/vault/FileOps.hpp"
#include "narrovault/vault/VaultStore.hpp"

namespace {

using narrovault::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    std::cerr << "\n[VAULT] Received signal " << signal << ", cancelling run...\n";
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string command;  // register | plan | generate | pick | assemble | status
  std::string config_path;
  std::string vault_dir;      // overrides config / environment
  std::string synth_target;   // overrides config / environment
  std::string session_id;
  std::string inventory_path;

  // generate / plan
  int extra = 0;
  std::vector<int> only_chunks;

  // pick
  int chunk_index = -1;
  int version = -1;
  std::string notes;

  // assemble
  std::optional<double> target_duration_s;

  std::string prometheus_path;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " COMMAND [OPTIONS]\n"
            << "\n"
            << "Narration vault: generates, scores and stores synthesis candidates,\n"
            << "then assembles picked candidates into a final narration.\n"
            << "\n"
            << "COMMANDS:\n"
            << "  register   --session ID --inventory PATH\n"
            << "  plan       --session ID [--extra N] [--chunks 0,2,5]\n"
            << "  generate   --session ID [--extra N] [--chunks 0,2,5] [--prometheus PATH]\n"
            << "  pick       --session ID --chunk N --version V [--notes TEXT]\n"
            << "  assemble   --session ID [--target-duration SECONDS]\n"
            << "  status     --session ID\n"
            << "\n"
            << "COMMON OPTIONS:\n"
            << "  --config PATH        key=value configuration file\n"
            << "  --vault DIR          Vault root (env NARROVAULT_VAULT_DIR)\n"
            << "  --synth-target ADDR  Synthesis service (env NARROVAULT_SYNTH_TARGET)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "    " << program_name << " register --session s01 --inventory intro.jsonl\n"
            << "    " << program_name << " generate --session s01 --prometheus /tmp/run.prom\n"
            << "    " << program_name << " pick --session s01 --chunk 0 --version 7\n"
            << "\n";
}

bool ParseChunkList(const std::string& text, std::vector<int>* out) {
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) continue;
    char* end = nullptr;
    const long v = std::strtol(item.c_str(), &end, 10);
    if (*end != '\0' || v < 0) return false;
    out->push_back(static_cast<int>(v));
  }
  return !out->empty();
}

bool ParseIntArg(const std::string& text, int* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (*end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  if (argc < 2) {
    args.error = "Missing command";
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (i == 1 && arg[0] != '-') {
      args.command = arg;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--vault" && i + 1 < argc) {
      args.vault_dir = argv[++i];
    } else if (arg == "--synth-target" && i + 1 < argc) {
      args.synth_target = argv[++i];
    } else if (arg == "--session" && i + 1 < argc) {
      args.session_id = argv[++i];
    } else if (arg == "--inventory" && i + 1 < argc) {
      args.inventory_path = argv[++i];
    } else if (arg == "--extra" && i + 1 < argc) {
      if (!ParseIntArg(argv[++i], &args.extra) || args.extra < 0) {
        args.error = "--extra expects a non-negative integer";
        return args;
      }
    } else if (arg == "--chunks" && i + 1 < argc) {
      if (!ParseChunkList(argv[++i], &args.only_chunks)) {
        args.error = "--chunks expects a comma-separated list of chunk indices";
        return args;
      }
    } else if (arg == "--chunk" && i + 1 < argc) {
      if (!ParseIntArg(argv[++i], &args.chunk_index)) {
        args.error = "--chunk expects an integer";
        return args;
      }
    } else if (arg == "--version" && i + 1 < argc) {
      if (!ParseIntArg(argv[++i], &args.version)) {
        args.error = "--version expects an integer";
        return args;
      }
    } else if (arg == "--notes" && i + 1 < argc) {
      args.notes = argv[++i];
    } else if (arg == "--target-duration" && i + 1 < argc) {
      char* end = nullptr;
      const std::string text = argv[++i];
      const double v = std::strtod(text.c_str(), &end);
      if (text.empty() || *end != '\0' || v <= 0.0) {
        args.error = "--target-duration expects a positive number of seconds";
        return args;
      }
      args.target_duration_s = v;
    } else if (arg == "--prometheus" && i + 1 < argc) {
      args.prometheus_path = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  static const char* kCommands[] = {"register", "plan", "generate", "pick", "assemble", "status"};
  bool known = false;
  for (const char* c : kCommands) known = known || args.command == c;
  if (!known) {
    args.error = "Unknown command: " + args.command;
    return args;
  }
  if (args.session_id.empty()) {
    args.error = "--session is required";
    return args;
  }
  if (args.command == "register" && args.inventory_path.empty()) {
    args.error = "register requires --inventory";
    return args;
  }
  if (args.command == "pick" && (args.chunk_index < 0 || args.version < 0)) {
    args.error = "pick requires --chunk N and --version V";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Output
// =============================================================================

void PrintPlan(const narrovault::session::GenerationPlan& plan) {
  std::cout << "session=" << plan.session_id << " script=" << plan.script_id << "\n";
  for (const auto& c : plan.chunks) {
    std::cout << "  chunk " << std::setw(3) << c.chunk_index << "  chars=" << std::setw(4)
              << c.char_count << "  target=" << std::setw(3) << c.target
              << "  existing=" << std::setw(3) << c.existing << "  new=" << c.to_generate << "\n";
  }
  std::cout << "total_new_candidates=" << plan.total_new_candidates
            << " total_characters=" << plan.total_characters << " estimated_cost_usd="
            << std::fixed << std::setprecision(4) << plan.estimated_cost_usd << "\n";
}

void PrintRunSummary(const narrovault::orchestrator::RunSummary& summary) {
  const auto& s = summary.stats;
  std::cout << "run_id=" << summary.run_id << (summary.cancelled ? " (cancelled)" : "") << "\n"
            << "  slots_requested=" << s.slots_requested
            << " candidates_written=" << s.candidates_written
            << " below_prefilter=" << s.candidates_below_prefilter
            << " failed=" << s.slots_failed << " cancelled=" << s.slots_cancelled << "\n"
            << "  attempts=" << s.attempts_total << " retries=" << s.retries
            << " throttled=" << s.throttled << " errors=" << s.ErrorCount()
            << " peak_in_flight=" << s.peak_in_flight << "\n"
            << "  billed_characters=" << s.billed_characters << " cost_estimate_usd="
            << std::fixed << std::setprecision(4) << s.cost_estimate_usd
            << " wall_ms=" << s.wall_ms << "\n";
  for (const auto& slot : summary.slots) {
    if (slot.outcome == narrovault::orchestrator::SlotOutcome::kCommitted) continue;
    std::cout << "  chunk " << slot.chunk_index << " slot " << slot.slot << ": "
              << narrovault::orchestrator::SlotOutcomeToString(slot.outcome);
    if (!slot.detail.empty()) std::cout << " (" << slot.detail << ")";
    std::cout << "\n";
  }
}

void PrintStatus(const narrovault::session::SessionStatusReport& report) {
  const auto& m = report.manifest;
  std::cout << "session=" << m.session_id << " script=" << m.script_id
            << " status=" << narrovault::session::SessionStatusToString(report.status) << "\n"
            << "  chunks=" << m.total_chunks << " candidates=" << m.total_candidates
            << " below_prefilter=" << m.candidates_below_prefilter
            << " picks=" << m.picks_recorded << " assemblies=" << report.assemblies << "\n"
            << "  api_calls=" << m.total_api_calls << " billed_characters=" << m.billed_characters
            << " estimated_cost_usd=" << std::fixed << std::setprecision(4)
            << m.estimated_cost_usd << "\n";
  for (const auto& c : report.chunks) {
    std::cout << "  chunk " << std::setw(3) << c.chunk_index << "  candidates=" << std::setw(3)
              << c.candidates << "  flagged=" << std::setw(3) << c.below_prefilter;
    if (c.best_score) std::cout << "  best=" << std::setprecision(3) << *c.best_score;
    if (c.picked_version) std::cout << "  picked=v" << *c.picked_version;
    std::cout << "\n";
  }
  if (report.illegal_transitions > 0) {
    std::cout << "  illegal_transitions=" << report.illegal_transitions << "\n";
  }
}

void PrintAssembly(const narrovault::assembly::AssemblyResult& result) {
  std::cout << "assembly=" << result.assembly_number
            << " stage=" << narrovault::assembly::AssemblyStageToString(result.stage) << "\n"
            << "  final=" << result.record.final_wav << " mp3=" << result.record.mp3 << "\n"
            << "  duration_s=" << std::fixed << std::setprecision(3)
            << result.record.duration_seconds << " integrated_lufs=" << std::setprecision(2)
            << result.record.integrated_lufs << " true_peak_dbtp="
            << result.record.true_peak_dbtp << "\n";
  for (const auto& gate : result.qa.gates) {
    std::cout << "  gate " << gate.name << ": "
              << (gate.skipped ? "SKIPPED" : (gate.passed ? "PASS" : "FAIL"));
    if (!gate.detail.empty()) std::cout << " (" << gate.detail << ")";
    std::cout << "\n";
  }
}

int RunCommand(const CliArgs& args, const narrovault::config::VaultConfig& config) {
  using namespace narrovault;

  vault::VaultStoreConfig store_config;
  store_config.root = config.vault_dir;
  store_config.prefilter_threshold = config.prefilter_threshold;
  vault::VaultStore store(store_config);

  std::vector<std::shared_ptr<vault::IBackupMirror>> mirrors;
  for (const auto& dir : config.backup_dirs) {
    mirrors.push_back(std::make_shared<vault::DirectoryMirror>(dir));
  }

  auto client = std::make_shared<synthesis::GrpcSynthesisClient>(config.synth_target);
  session::SessionPipeline pipeline(config.pipeline, store, client, mirrors);

  session::GenerateOptions options;
  options.extra = args.extra;
  options.only_chunks = args.only_chunks;

  if (args.command == "register") {
    const inventory::ScriptInventory inv = inventory::LoadInventoryFile(args.inventory_path);
    pipeline.Register(args.session_id, inv);
    PrintStatus(pipeline.Status(args.session_id));
    return 0;
  }
  if (args.command == "plan") {
    PrintPlan(pipeline.Plan(args.session_id, options));
    return 0;
  }
  if (args.command == "generate") {
    std::atomic<bool> run_finished{false};
    std::thread watcher([&pipeline, &run_finished]() {
      while (!run_finished.load(std::memory_order_acquire)) {
        if (g_termination_requested.load(std::memory_order_acquire)) {
          pipeline.Cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    orchestrator::RunSummary summary;
    try {
      summary = pipeline.Generate(args.session_id, options);
    } catch (...) {
      run_finished.store(true, std::memory_order_release);
      watcher.join();
      throw;
    }
    run_finished.store(true, std::memory_order_release);
    watcher.join();

    PrintRunSummary(summary);
    const std::string prom_path =
        args.prometheus_path.empty() ? config.metrics_path : args.prometheus_path;
    if (!prom_path.empty()) {
      vault::WriteFileAtomic(prom_path, summary.stats.GeneratePrometheusText());
      Logger::Info("[VAULT] METRICS_WRITTEN path=" + prom_path);
    }
    return summary.cancelled ? 130 : 0;
  }
  if (args.command == "pick") {
    vault::PickRecord pick;
    pick.chunk_index = args.chunk_index;
    pick.picked_version = args.version;
    pick.notes = args.notes;
    pipeline.RecordPick(args.session_id, pick);
    PrintStatus(pipeline.Status(args.session_id));
    return 0;
  }
  if (args.command == "assemble") {
    PrintAssembly(pipeline.Assemble(args.session_id, args.target_duration_s));
    return 0;
  }
  PrintStatus(pipeline.Status(args.session_id));
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  narrovault::config::VaultConfig config;
  try {
    if (!args.config_path.empty()) {
      config = narrovault::config::ConfigLoader::LoadFile(args.config_path);
    }
    narrovault::config::ConfigLoader::ApplyEnvironment(config);
  } catch (const narrovault::ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (!args.vault_dir.empty()) config.vault_dir = args.vault_dir;
  if (!args.synth_target.empty()) config.synth_target = args.synth_target;

  try {
    return RunCommand(args, config);
  } catch (const narrovault::QaGateFailure& e) {
    std::cerr << "QA failed: " << e.what() << "\n";
    return 3;
  } catch (const narrovault::RunInProgress& e) {
    std::cerr << "Busy: " << e.what() << "\n";
    return 4;
  } catch (const narrovault::VaultError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  }
}
