// Repository: NarroVault
// Component: Session state machine
// Purpose: Session status lifecycle with a single explicit reopen edge;
//          illegal transitions are rejected and counted.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_SESSION_SESSION_STATE_MACHINE_HPP_
#define NARROVAULT_SESSION_SESSION_STATE_MACHINE_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "narrovault/vault/VaultRecords.hpp"

namespace narrovault::session {

enum class SessionStatus {
  kPending = 0,
  kCandidatesReady = 1,
  kPicksComplete = 2,
  kAssembled = 3,
  kQaPassed = 4,
  kQaFailed = 5,
};

const char* SessionStatusToString(SessionStatus status);
bool SessionStatusFromString(const std::string& text, SessionStatus* out);

class SessionStateMachine {
 public:
  struct MetricsSnapshot {
    std::map<std::pair<SessionStatus, SessionStatus>, uint64_t> transitions;
    uint64_t illegal_transition_total = 0;
    uint64_t reopen_total = 0;
    SessionStatus state = SessionStatus::kPending;
  };

  explicit SessionStateMachine(SessionStatus initial = SessionStatus::kPending);

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  // PENDING -> CANDIDATES_READY -> PICKS_COMPLETE -> ASSEMBLED
  //   -> QA_PASSED | QA_FAILED
  static bool IsForwardEdge(SessionStatus from, SessionStatus to);
  // {ASSEMBLED, QA_PASSED, QA_FAILED} -> PICKS_COMPLETE
  static bool CanReopen(SessionStatus from);

  // Forward transition. Returns false (and counts it) when the edge is not
  // allowed. A transition to the current state is a no-op that succeeds.
  bool Transition(SessionStatus to);

  // Reopen edge back to PICKS_COMPLETE. Returns false (and counts it) from
  // any other state.
  bool Reopen();

  // Rebuilds state from a persisted status history. Records that are not
  // legal edges are counted and skipped.
  void Replay(const std::vector<vault::StatusRecord>& history);

  SessionStatus state() const;
  MetricsSnapshot Snapshot() const;

 private:
  void TransitionLocked(SessionStatus to);
  void RecordIllegalTransitionLocked(SessionStatus from, SessionStatus attempted_to);

  mutable std::mutex mutex_;
  SessionStatus state_;
  std::map<std::pair<SessionStatus, SessionStatus>, uint64_t> transitions_;
  uint64_t illegal_transition_total_ = 0;
  uint64_t reopen_total_ = 0;
};

}  // namespace narrovault::session

#endif  // NARROVAULT_SESSION_SESSION_STATE_MACHINE_HPP_
