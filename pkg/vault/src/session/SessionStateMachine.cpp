// Repository: NarroVault
// Component: Session state machine
// Purpose: Session status lifecycle with a single explicit reopen edge.
// Copyright (c) 2026 NarroVault

#include "narrovault/session/SessionStateMachine.hpp"

#include "narrovault/util/Logger.hpp"

namespace narrovault::session {

using narrovault::util::Logger;

const char* SessionStatusToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kPending: return "PENDING";
    case SessionStatus::kCandidatesReady: return "CANDIDATES_READY";
    case SessionStatus::kPicksComplete: return "PICKS_COMPLETE";
    case SessionStatus::kAssembled: return "ASSEMBLED";
    case SessionStatus::kQaPassed: return "QA_PASSED";
    case SessionStatus::kQaFailed: return "QA_FAILED";
  }
  return "UNKNOWN";
}

bool SessionStatusFromString(const std::string& text, SessionStatus* out) {
  static const SessionStatus kAll[] = {
      SessionStatus::kPending,   SessionStatus::kCandidatesReady, SessionStatus::kPicksComplete,
      SessionStatus::kAssembled, SessionStatus::kQaPassed,        SessionStatus::kQaFailed,
  };
  for (SessionStatus s : kAll) {
    if (text == SessionStatusToString(s)) {
      *out = s;
      return true;
    }
  }
  return false;
}

SessionStateMachine::SessionStateMachine(SessionStatus initial) : state_(initial) {}

bool SessionStateMachine::IsForwardEdge(SessionStatus from, SessionStatus to) {
  switch (from) {
    case SessionStatus::kPending:
      return to == SessionStatus::kCandidatesReady;
    case SessionStatus::kCandidatesReady:
      return to == SessionStatus::kPicksComplete;
    case SessionStatus::kPicksComplete:
      return to == SessionStatus::kAssembled;
    case SessionStatus::kAssembled:
      return to == SessionStatus::kQaPassed || to == SessionStatus::kQaFailed;
    case SessionStatus::kQaPassed:
    case SessionStatus::kQaFailed:
      return false;
  }
  return false;
}

bool SessionStateMachine::CanReopen(SessionStatus from) {
  return from == SessionStatus::kAssembled || from == SessionStatus::kQaPassed ||
         from == SessionStatus::kQaFailed;
}

bool SessionStateMachine::Transition(SessionStatus to) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == to) return true;
  if (!IsForwardEdge(state_, to)) {
    RecordIllegalTransitionLocked(state_, to);
    return false;
  }
  TransitionLocked(to);
  return true;
}

bool SessionStateMachine::Reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!CanReopen(state_)) {
    RecordIllegalTransitionLocked(state_, SessionStatus::kPicksComplete);
    return false;
  }
  ++reopen_total_;
  TransitionLocked(SessionStatus::kPicksComplete);
  return true;
}

void SessionStateMachine::Replay(const std::vector<vault::StatusRecord>& history) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& rec : history) {
    SessionStatus to;
    if (!SessionStatusFromString(rec.to, &to)) {
      Logger::Warn("[SessionStateMachine] UNKNOWN_STATUS_RECORD to=" + rec.to);
      ++illegal_transition_total_;
      continue;
    }
    if (state_ == to) continue;
    if (rec.reopen && CanReopen(state_) && to == SessionStatus::kPicksComplete) {
      ++reopen_total_;
      TransitionLocked(to);
    } else if (!rec.reopen && IsForwardEdge(state_, to)) {
      TransitionLocked(to);
    } else {
      RecordIllegalTransitionLocked(state_, to);
    }
  }
}

SessionStatus SessionStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

SessionStateMachine::MetricsSnapshot SessionStateMachine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot;
  snapshot.transitions = transitions_;
  snapshot.illegal_transition_total = illegal_transition_total_;
  snapshot.reopen_total = reopen_total_;
  snapshot.state = state_;
  return snapshot;
}

void SessionStateMachine::TransitionLocked(SessionStatus to) {
  if (state_ == to) return;
  transitions_[{state_, to}]++;
  state_ = to;
}

void SessionStateMachine::RecordIllegalTransitionLocked(SessionStatus from,
                                                        SessionStatus attempted_to) {
  ++illegal_transition_total_;
  transitions_[{from, attempted_to}]++;
  Logger::Warn(std::string("[SessionStateMachine] ILLEGAL_TRANSITION from=") +
               SessionStatusToString(from) + " to=" + SessionStatusToString(attempted_to));
}

}  // namespace narrovault::session
