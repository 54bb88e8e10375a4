// Repository: NarroVault
// Component: Session Pipeline
// Purpose: Coordinates register -> generate -> pick -> assemble for one
//          session.
// Copyright (c) 2026 NarroVault

#include "narrovault/session/SessionPipeline.hpp"

#include <algorithm>
#include <exception>
#include <set>
#include <sstream>

#include "narrovault/util/Logger.hpp"
#include "narrovault/util/TimeFormat.hpp"
#include "narrovault/util/VaultError.hpp"
#include "narrovault/vault/VaultLayout.hpp"

namespace narrovault::session {

using narrovault::util::Logger;

SessionPipeline::SessionPipeline(PipelineConfig config, vault::VaultStore& store,
                                 std::shared_ptr<synthesis::ISynthesisClient> client,
                                 std::vector<std::shared_ptr<vault::IBackupMirror>> mirrors,
                                 std::shared_ptr<orchestrator::IWaitStrategy> wait_strategy,
                                 std::shared_ptr<assembly::IPauseHumanizer> humanizer)
    : config_(std::move(config)),
      store_(store),
      client_(std::move(client)),
      mirrors_(std::move(mirrors)),
      wait_(std::move(wait_strategy)),
      humanizer_(std::move(humanizer)),
      validator_(config_.chunk_policy) {}

// =============================================================================
// Register
// =============================================================================

void SessionPipeline::Register(const std::string& session_id,
                               const inventory::ScriptInventory& inventory) {
  if (!vault::VaultLayout::IsValidSessionId(session_id)) {
    throw VaultError("SessionPipeline: invalid session id '" + session_id + "'");
  }

  const auto result = validator_.Validate(inventory);
  if (!result.valid) {
    Logger::Error(std::string("[SessionPipeline] INVENTORY_INVALID session=") + session_id +
                  " error=" + inventory::InventoryErrorToString(result.error) +
                  " detail=\"" + result.detail + "\"");
    throw InventoryInvalid(std::string("inventory invalid: ") +
                               inventory::InventoryErrorToString(result.error) + " " +
                               result.detail,
                           ErrorContext{session_id, result.chunk_index, "REGISTER"});
  }

  const auto violations = validator_.CheckVaultReady(inventory);
  for (const auto& v : violations) {
    std::ostringstream msg;
    msg << "[SessionPipeline] CHUNK_POLICY session=" << session_id
        << " chunk=" << v.chunk_index << " error=" << inventory::InventoryErrorToString(v.error)
        << " detail=\"" << v.detail << "\"";
    Logger::Warn(msg.str());
  }
  if (config_.require_vault_ready && !violations.empty()) {
    const auto& v = violations.front();
    throw InventoryInvalid(std::string("inventory not vault-ready: ") +
                               inventory::InventoryErrorToString(v.error) + " " + v.detail,
                           ErrorContext{session_id, v.chunk_index, "REGISTER"});
  }

  if (store_.SessionExists(session_id)) {
    auto existing = store_.ReadManifest(session_id);
    if (existing && existing->script_id != inventory.script_id()) {
      throw VaultError("SessionPipeline: session already registered for script '" +
                           existing->script_id + "'",
                       ErrorContext{session_id, -1, "REGISTER"});
    }
  }

  const int appended = store_.RecordInventory(inventory);
  store_.EnsureSessionLayout(session_id);

  if (store_.StatusHistory(session_id).empty()) {
    vault::StatusRecord initial;
    initial.to = SessionStatusToString(SessionStatus::kPending);
    initial.reason = "registered";
    initial.at_ms = store_.time_source().NowUtcMs();
    store_.AppendStatus(session_id, initial);
  }

  if (!store_.ReadManifest(session_id)) {
    vault::SessionManifest seed;
    seed.session_id = session_id;
    seed.script_id = inventory.script_id();
    seed.status = SessionStatusToString(SessionStatus::kPending);
    store_.WriteManifest(seed);
  }
  RefreshManifest(session_id);

  std::ostringstream msg;
  msg << "[SessionPipeline] REGISTERED session=" << session_id
      << " script=" << inventory.script_id() << " chunks=" << inventory.size()
      << " chunk_records_appended=" << appended
      << " policy_violations=" << violations.size();
  Logger::Info(msg.str());

  if (!MirrorWrittenFiles(session_id)) {
    throw BackupIncomplete("SessionPipeline: backup incomplete after register",
                           ErrorContext{session_id, -1, "REGISTER"});
  }
}

// =============================================================================
// Plan / Generate
// =============================================================================

SessionPipeline::SessionContext SessionPipeline::LoadContext(const std::string& session_id) const {
  if (!store_.SessionExists(session_id)) {
    throw VaultError("SessionPipeline: unknown session", ErrorContext{session_id, -1, ""});
  }
  auto manifest = store_.ReadManifest(session_id);
  if (!manifest) {
    throw VaultError("SessionPipeline: session has no manifest", ErrorContext{session_id, -1, ""});
  }
  auto inventory = store_.LoadInventory(manifest->script_id);
  if (!inventory || inventory->empty()) {
    throw InventoryInvalid("SessionPipeline: no inventory for script '" + manifest->script_id +
                               "'",
                           ErrorContext{session_id, -1, ""});
  }
  return SessionContext{std::move(*manifest), std::move(*inventory)};
}

std::vector<ChunkPlan> SessionPipeline::BuildPlan(const SessionContext& ctx,
                                                  const GenerateOptions& options) const {
  const std::string& session = ctx.manifest.session_id;
  if (options.extra < 0) {
    throw VaultError("SessionPipeline: extra must be >= 0", ErrorContext{session, -1, "PLAN"});
  }
  std::set<int> only(options.only_chunks.begin(), options.only_chunks.end());
  for (int idx : only) {
    if (idx < 0 || idx >= ctx.inventory.size()) {
      throw VaultError("SessionPipeline: no such chunk", ErrorContext{session, idx, "PLAN"});
    }
  }

  std::vector<ChunkPlan> plan;
  for (const auto& chunk : ctx.inventory.chunks()) {
    if (!only.empty() && only.count(chunk.chunk_index) == 0) continue;
    ChunkPlan p;
    p.chunk_index = chunk.chunk_index;
    p.char_count = chunk.char_count;
    p.target = config_.candidates.CountFor(chunk);
    p.existing = static_cast<int>(
        store_.ListCandidates(session, chunk.chunk_index, /*include_below_prefilter=*/true).size());
    p.to_generate = std::max(0, p.target - p.existing) + options.extra;
    plan.push_back(p);
  }
  return plan;
}

GenerationPlan SessionPipeline::Plan(const std::string& session_id,
                                     const GenerateOptions& options) const {
  const SessionContext ctx = LoadContext(session_id);
  GenerationPlan plan;
  plan.session_id = session_id;
  plan.script_id = ctx.manifest.script_id;
  plan.chunks = BuildPlan(ctx, options);
  for (const auto& p : plan.chunks) {
    plan.total_new_candidates += p.to_generate;
    plan.total_characters += static_cast<uint64_t>(p.to_generate) * static_cast<uint64_t>(p.char_count);
  }
  plan.estimated_cost_usd = static_cast<double>(plan.total_characters) / 1000.0 *
                            config_.orchestrator.cost.usd_per_1k_characters;

  std::ostringstream msg;
  msg << "[SessionPipeline] PLAN session=" << session_id
      << " chunks=" << plan.chunks.size()
      << " new_candidates=" << plan.total_new_candidates
      << " characters=" << plan.total_characters
      << " estimated_cost_usd=" << plan.estimated_cost_usd;
  Logger::Info(msg.str());
  return plan;
}

orchestrator::RunSummary SessionPipeline::Generate(const std::string& session_id,
                                                   const GenerateOptions& options) {
  vault::RunLock run_lock(store_.layout().LockFile(), config_.lock_policy);

  const SessionContext ctx = LoadContext(session_id);
  const std::vector<ChunkPlan> plan = BuildPlan(ctx, options);

  std::vector<orchestrator::GenerationRequest> requests;
  for (const auto& p : plan) {
    if (p.to_generate <= 0) continue;
    requests.push_back(orchestrator::GenerationRequest{ctx.inventory.at(p.chunk_index), p.to_generate});
  }
  if (requests.empty()) {
    Logger::Info("[SessionPipeline] GENERATE_NOTHING_TO_DO session=" + session_id);
  }

  orchestrator::GenerationOrchestrator orch(config_.orchestrator, client_, store_,
                                            config_.scorer, wait_);
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = &orch;
    if (cancel_pending_) orch.Cancel();
  }
  orchestrator::RunSummary summary;
  try {
    summary = orch.Run(session_id, requests, options.run_id);
  } catch (...) {
    const std::exception_ptr fatal = std::current_exception();
    {
      std::lock_guard<std::mutex> lock(active_mutex_);
      active_ = nullptr;
      cancel_pending_ = false;
    }
    // Calls already made are billed; the run is recorded before the failure
    // propagates.
    const orchestrator::RunSummary partial = orch.LastSummary();
    Logger::Error("[SessionPipeline] GENERATE_ABORTED session=" + session_id +
                  " run=" + partial.run_id +
                  " api_calls=" + std::to_string(partial.stats.attempts_total) +
                  " written=" + std::to_string(partial.stats.candidates_written));
    try {
      RecordRun(session_id, partial);
    } catch (const std::exception& e) {
      Logger::Error("[SessionPipeline] RUN_RECORD_FAILED session=" + session_id +
                    " run=" + partial.run_id + " error=" + e.what());
    }
    std::rethrow_exception(fatal);
  }
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    active_ = nullptr;
    cancel_pending_ = false;
  }

  if (CurrentStatus(session_id) == SessionStatus::kPending && AllChunksHaveCandidates(ctx)) {
    TransitionTo(session_id, SessionStatus::kCandidatesReady,
                 "generation run " + summary.run_id);
  }

  const bool mirrored = RecordRun(session_id, summary);

  const auto& stats = summary.stats;
  std::ostringstream msg;
  msg << "[SessionPipeline] GENERATE_COMPLETE session=" << session_id
      << " run=" << summary.run_id
      << " written=" << stats.candidates_written
      << " below_prefilter=" << stats.candidates_below_prefilter
      << " failed=" << stats.slots_failed
      << " api_calls=" << stats.attempts_total
      << " cost_usd=" << stats.cost_estimate_usd
      << " cancelled=" << (summary.cancelled ? "true" : "false")
      << " status=" << SessionStatusToString(CurrentStatus(session_id));
  Logger::Info(msg.str());

  if (!mirrored) {
    throw BackupIncomplete("SessionPipeline: backup incomplete after generation run " +
                               summary.run_id,
                           ErrorContext{session_id, -1, "GENERATE"});
  }
  return summary;
}

bool SessionPipeline::RecordRun(const std::string& session_id,
                                const orchestrator::RunSummary& summary) {
  const auto& stats = summary.stats;
  vault::GenerationLogEntry entry;
  entry.run_id = summary.run_id;
  entry.started_at_ms = summary.started_at_ms;
  entry.completed_at_ms = summary.completed_at_ms;
  entry.scripts.push_back(session_id);
  entry.scripts_processed = 1;
  entry.total_api_calls = stats.attempts_total;
  entry.attempted_characters = stats.attempted_characters;
  entry.billed_characters = stats.billed_characters;
  entry.cost_estimate_usd = stats.cost_estimate_usd;
  entry.candidates_written = stats.candidates_written;
  entry.slots_failed = stats.slots_failed;
  entry.errors = stats.ErrorCount();
  entry.retries = stats.retries;
  entry.throttled = stats.throttled;
  entry.cancelled = summary.cancelled;
  entry.aborted = summary.aborted;

  // Candidate data first; the run record then says whether that copy is
  // complete, and is mirrored itself together with the manifest.
  const bool data_mirrored = MirrorWrittenFiles(session_id);
  entry.backup_complete = data_mirrored;
  store_.AppendGenerationLog(entry);
  RefreshManifest(session_id);
  const bool log_mirrored = MirrorWrittenFiles(session_id);
  return data_mirrored && log_mirrored;
}

bool SessionPipeline::AllChunksHaveCandidates(const SessionContext& ctx) const {
  for (const auto& chunk : ctx.inventory.chunks()) {
    if (store_.ListCandidates(ctx.manifest.session_id, chunk.chunk_index, true).empty()) {
      return false;
    }
  }
  return true;
}

void SessionPipeline::Cancel() {
  std::lock_guard<std::mutex> lock(active_mutex_);
  cancel_pending_ = true;
  if (active_) active_->Cancel();
}

// =============================================================================
// Picks
// =============================================================================

void SessionPipeline::RecordPick(const std::string& session_id, const vault::PickRecord& pick) {
  const SessionContext ctx = LoadContext(session_id);
  if (pick.chunk_index < 0 || pick.chunk_index >= ctx.inventory.size()) {
    throw VaultError("SessionPipeline: pick for unknown chunk",
                     ErrorContext{session_id, pick.chunk_index, "RECORD_PICK"});
  }

  const auto before = store_.ActivePicks(session_id);
  store_.RecordPick(session_id, pick);
  auto prev = before.find(pick.chunk_index);
  const bool changed = prev == before.end() || prev->second.picked_version != pick.picked_version;

  if (changed && SessionStateMachine::CanReopen(CurrentStatus(session_id))) {
    ReopenSession(session_id, "pick changed chunk=" + std::to_string(pick.chunk_index));
  }

  const SessionStatus status = CurrentStatus(session_id);
  if (status == SessionStatus::kPending || status == SessionStatus::kCandidatesReady) {
    const auto active = store_.ActivePicks(session_id);
    bool complete = true;
    for (const auto& chunk : ctx.inventory.chunks()) {
      if (active.find(chunk.chunk_index) == active.end()) {
        complete = false;
        break;
      }
    }
    if (complete) {
      // Every pick names a committed candidate, so candidates exist for all
      // chunks.
      if (status == SessionStatus::kPending) {
        TransitionTo(session_id, SessionStatus::kCandidatesReady, "all chunks have candidates");
      }
      TransitionTo(session_id, SessionStatus::kPicksComplete, "every chunk picked");
    }
  }

  RefreshManifest(session_id);
  if (!MirrorWrittenFiles(session_id)) {
    throw BackupIncomplete("SessionPipeline: backup incomplete after pick",
                           ErrorContext{session_id, pick.chunk_index, "RECORD_PICK"});
  }
}

// =============================================================================
// Assemble
// =============================================================================

assembly::AssemblyResult SessionPipeline::Assemble(const std::string& session_id,
                                                   std::optional<double> target_duration_s) {
  const SessionContext ctx = LoadContext(session_id);

  if (SessionStateMachine::CanReopen(CurrentStatus(session_id))) {
    ReopenSession(session_id, "reassembly requested");
  }

  assembly::AssemblyInput input;
  input.session_id = session_id;
  input.inventory = ctx.inventory;
  input.picks = store_.ActivePicks(session_id);
  input.target_duration_s = target_duration_s;

  const SessionStatus status = CurrentStatus(session_id);
  if (status == SessionStatus::kPending || status == SessionStatus::kCandidatesReady) {
    bool complete = true;
    for (const auto& chunk : ctx.inventory.chunks()) {
      if (input.picks.find(chunk.chunk_index) == input.picks.end()) complete = false;
    }
    if (complete) {
      if (status == SessionStatus::kPending) {
        TransitionTo(session_id, SessionStatus::kCandidatesReady, "all chunks have candidates");
      }
      TransitionTo(session_id, SessionStatus::kPicksComplete, "every chunk picked");
    }
  }

  assembly::AssemblyEngine engine(config_.assembly, store_, humanizer_, config_.qa);
  assembly::AssemblyResult result;
  try {
    result = engine.Assemble(input);
  } catch (const QaGateFailure& e) {
    const auto assemblies = store_.Assemblies(session_id);
    const std::string number =
        assemblies.empty() ? "?" : std::to_string(assemblies.back().assembly_number);
    TransitionTo(session_id, SessionStatus::kAssembled, "assembly " + number);
    TransitionTo(session_id, SessionStatus::kQaFailed, e.what());
    RefreshManifest(session_id);
    if (!MirrorWrittenFiles(session_id)) {
      Logger::Error("[SessionPipeline] BACKUP_INCOMPLETE session=" + session_id +
                    " after=QA_FAILED");
    }
    throw;
  }

  TransitionTo(session_id, SessionStatus::kAssembled,
               "assembly " + std::to_string(result.assembly_number));
  TransitionTo(session_id, SessionStatus::kQaPassed, "all gates passed");
  RefreshManifest(session_id);
  if (!MirrorWrittenFiles(session_id)) {
    throw BackupIncomplete("SessionPipeline: backup incomplete after assembly " +
                               std::to_string(result.assembly_number),
                           ErrorContext{session_id, -1, "ASSEMBLE"});
  }
  return result;
}

// =============================================================================
// Status / manifest
// =============================================================================

SessionStateMachine& SessionPipeline::MachineFor(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(machines_mutex_);
  auto it = machines_.find(session_id);
  if (it != machines_.end()) return *it->second;
  auto machine = std::make_unique<SessionStateMachine>();
  machine->Replay(store_.StatusHistory(session_id));
  auto& ref = *machine;
  machines_.emplace(session_id, std::move(machine));
  return ref;
}

SessionStatus SessionPipeline::CurrentStatus(const std::string& session_id) const {
  return MachineFor(session_id).state();
}

void SessionPipeline::TransitionTo(const std::string& session_id, SessionStatus to,
                                   const std::string& reason) {
  auto& machine = MachineFor(session_id);
  const SessionStatus from = machine.state();
  if (from == to) return;
  if (!machine.Transition(to)) {
    throw IllegalTransition(std::string("illegal status transition ") +
                                SessionStatusToString(from) + " -> " + SessionStatusToString(to),
                            ErrorContext{session_id, -1, "STATUS"});
  }
  vault::StatusRecord rec;
  rec.from = SessionStatusToString(from);
  rec.to = SessionStatusToString(to);
  rec.reason = reason;
  rec.at_ms = store_.time_source().NowUtcMs();
  store_.AppendStatus(session_id, rec);
  Logger::Info("[SessionPipeline] STATUS session=" + session_id + " from=" + rec.from +
               " to=" + rec.to + " reason=\"" + reason + "\"");
}

void SessionPipeline::ReopenSession(const std::string& session_id, const std::string& reason) {
  auto& machine = MachineFor(session_id);
  const SessionStatus from = machine.state();
  if (!machine.Reopen()) {
    throw IllegalTransition(std::string("cannot reopen from ") + SessionStatusToString(from),
                            ErrorContext{session_id, -1, "STATUS"});
  }
  vault::StatusRecord rec;
  rec.from = SessionStatusToString(from);
  rec.to = SessionStatusToString(SessionStatus::kPicksComplete);
  rec.reason = reason;
  rec.reopen = true;
  rec.at_ms = store_.time_source().NowUtcMs();
  store_.AppendStatus(session_id, rec);
  Logger::Info("[SessionPipeline] REOPEN session=" + session_id + " from=" + rec.from +
               " reason=\"" + reason + "\"");
}

vault::SessionManifest SessionPipeline::RefreshManifest(const std::string& session_id) {
  const SessionContext ctx = LoadContext(session_id);
  vault::SessionManifest m;
  m.session_id = session_id;
  m.script_id = ctx.manifest.script_id;
  m.total_chunks = ctx.inventory.size();
  m.category = ctx.inventory.category();
  m.emotion = ctx.inventory.emotion();

  for (const auto& chunk : ctx.inventory.chunks()) {
    const auto all = store_.ListCandidates(session_id, chunk.chunk_index, true);
    bool any_passing = false;
    for (const auto& c : all) {
      ++m.total_candidates;
      if (c.below_prefilter) {
        ++m.candidates_below_prefilter;
      } else {
        any_passing = true;
      }
    }
    if (!any_passing) ++m.chunks_below_prefilter;
  }

  for (const auto& call : store_.CallAttempts(session_id)) {
    ++m.total_api_calls;
    m.total_characters_sent += static_cast<uint64_t>(call.characters);
  }
  for (const auto& run : store_.GenerationLog()) {
    if (std::find(run.scripts.begin(), run.scripts.end(), session_id) == run.scripts.end()) {
      continue;
    }
    m.billed_characters += run.billed_characters;
    m.estimated_cost_usd += run.cost_estimate_usd;
    m.generation_time_seconds +=
        static_cast<double>(run.completed_at_ms - run.started_at_ms) / 1000.0;
  }

  m.status = SessionStatusToString(CurrentStatus(session_id));
  m.picks_recorded = static_cast<int>(store_.ActivePicks(session_id).size());
  for (const auto& a : store_.Assemblies(session_id)) {
    m.last_assembly = std::max(m.last_assembly, a.assembly_number);
  }
  m.updated_utc = util::FormatIso8601Utc(store_.time_source().NowUtcMs());
  store_.WriteManifest(m);
  return m;
}

SessionStatusReport SessionPipeline::Status(const std::string& session_id) const {
  const SessionContext ctx = LoadContext(session_id);
  SessionStatusReport report;
  report.manifest = ctx.manifest;
  report.status = CurrentStatus(session_id);
  report.illegal_transitions = MachineFor(session_id).Snapshot().illegal_transition_total;
  report.assemblies = static_cast<int>(store_.Assemblies(session_id).size());

  const auto picks = store_.ActivePicks(session_id);
  for (const auto& chunk : ctx.inventory.chunks()) {
    ChunkStatus cs;
    cs.chunk_index = chunk.chunk_index;
    for (const auto& c : store_.ListCandidates(session_id, chunk.chunk_index, true)) {
      ++cs.candidates;
      if (c.below_prefilter) ++cs.below_prefilter;
    }
    if (auto best = store_.BestCandidate(session_id, chunk.chunk_index)) {
      cs.best_score = best->composite_score;
    }
    auto pick = picks.find(chunk.chunk_index);
    if (pick != picks.end()) cs.picked_version = pick->second.picked_version;
    report.chunks.push_back(cs);
  }
  return report;
}

// =============================================================================
// Backup
// =============================================================================

bool SessionPipeline::MirrorWrittenFiles(const std::string& session_id) {
  const std::vector<std::string> paths = store_.TakeWrittenPaths();
  if (mirrors_.empty()) return true;

  const auto& layout = store_.layout();
  bool complete = true;
  for (const auto& mirror : mirrors_) {
    for (const auto& path : paths) {
      std::string error;
      if (!mirror->Mirror(layout.root(), layout.Relative(path), &error)) {
        complete = false;
        Logger::Error("[SessionPipeline] BACKUP_FAILED session=" + session_id + " path=" +
                      layout.Relative(path) + " error=\"" + error + "\"");
      }
    }
    std::string error;
    if (!mirror->Flush(&error)) {
      complete = false;
      Logger::Error("[SessionPipeline] BACKUP_FLUSH_FAILED session=" + session_id +
                    " error=\"" + error + "\"");
    }
  }
  std::ostringstream msg;
  msg << "[SessionPipeline] BACKUP session=" << session_id << " files=" << paths.size()
      << " mirrors=" << mirrors_.size() << " complete=" << (complete ? "true" : "false");
  Logger::Info(msg.str());
  return complete;
}

}  // namespace narrovault::session
