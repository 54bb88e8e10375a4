// Repository: NarroVault
// Component: Session state machine contract tests
// Purpose: Forward edges, the single reopen edge, illegal-transition
//          accounting and replay from persisted history.
// Copyright (c) 2026 NarroVault

#include <gtest/gtest.h>

#include <vector>

#include "narrovault/session/SessionStateMachine.hpp"

namespace narrovault::session {
namespace {

vault::StatusRecord Rec(const char* to, bool reopen = false) {
  vault::StatusRecord r;
  r.to = to;
  r.reopen = reopen;
  return r;
}

TEST(SessionStateMachineContract, HappyPathWalksEveryForwardEdge) {
  SessionStateMachine m;
  EXPECT_EQ(m.state(), SessionStatus::kPending);
  EXPECT_TRUE(m.Transition(SessionStatus::kCandidatesReady));
  EXPECT_TRUE(m.Transition(SessionStatus::kPicksComplete));
  EXPECT_TRUE(m.Transition(SessionStatus::kAssembled));
  EXPECT_TRUE(m.Transition(SessionStatus::kQaPassed));
  EXPECT_EQ(m.state(), SessionStatus::kQaPassed);

  const auto snap = m.Snapshot();
  EXPECT_EQ(snap.illegal_transition_total, 0u);
  EXPECT_EQ(snap.transitions.at({SessionStatus::kAssembled, SessionStatus::kQaPassed}), 1u);
}

TEST(SessionStateMachineContract, SkippingAStageIsRejectedAndCounted) {
  SessionStateMachine m;
  EXPECT_FALSE(m.Transition(SessionStatus::kAssembled));
  EXPECT_EQ(m.state(), SessionStatus::kPending);
  EXPECT_EQ(m.Snapshot().illegal_transition_total, 1u);
}

TEST(SessionStateMachineContract, NoBackwardEdgeExceptReopen) {
  SessionStateMachine m(SessionStatus::kQaFailed);
  EXPECT_FALSE(m.Transition(SessionStatus::kPicksComplete));
  EXPECT_FALSE(m.Transition(SessionStatus::kCandidatesReady));
  EXPECT_EQ(m.Snapshot().illegal_transition_total, 2u);

  EXPECT_TRUE(m.Reopen());
  EXPECT_EQ(m.state(), SessionStatus::kPicksComplete);
  EXPECT_EQ(m.Snapshot().reopen_total, 1u);
}

TEST(SessionStateMachineContract, ReopenOnlyFromAssembledOrLater) {
  EXPECT_FALSE(SessionStateMachine::CanReopen(SessionStatus::kPending));
  EXPECT_FALSE(SessionStateMachine::CanReopen(SessionStatus::kCandidatesReady));
  EXPECT_FALSE(SessionStateMachine::CanReopen(SessionStatus::kPicksComplete));
  EXPECT_TRUE(SessionStateMachine::CanReopen(SessionStatus::kAssembled));
  EXPECT_TRUE(SessionStateMachine::CanReopen(SessionStatus::kQaPassed));
  EXPECT_TRUE(SessionStateMachine::CanReopen(SessionStatus::kQaFailed));

  SessionStateMachine m(SessionStatus::kCandidatesReady);
  EXPECT_FALSE(m.Reopen());
  EXPECT_EQ(m.state(), SessionStatus::kCandidatesReady);
  EXPECT_EQ(m.Snapshot().illegal_transition_total, 1u);
}

TEST(SessionStateMachineContract, SelfTransitionIsANoOp) {
  SessionStateMachine m(SessionStatus::kPicksComplete);
  EXPECT_TRUE(m.Transition(SessionStatus::kPicksComplete));
  EXPECT_TRUE(m.Snapshot().transitions.empty());
}

TEST(SessionStateMachineContract, StatusNamesRoundTrip) {
  for (auto s : {SessionStatus::kPending, SessionStatus::kCandidatesReady,
                 SessionStatus::kPicksComplete, SessionStatus::kAssembled,
                 SessionStatus::kQaPassed, SessionStatus::kQaFailed}) {
    SessionStatus parsed = SessionStatus::kPending;
    ASSERT_TRUE(SessionStatusFromString(SessionStatusToString(s), &parsed));
    EXPECT_EQ(parsed, s);
  }
  SessionStatus ignored;
  EXPECT_FALSE(SessionStatusFromString("DONE", &ignored));
}

TEST(SessionStateMachineContract, ReplayRebuildsStateIncludingReopen) {
  SessionStateMachine m;
  m.Replay({Rec("PENDING"), Rec("CANDIDATES_READY"), Rec("PICKS_COMPLETE"), Rec("ASSEMBLED"),
            Rec("QA_FAILED"), Rec("PICKS_COMPLETE", /*reopen=*/true), Rec("ASSEMBLED"),
            Rec("QA_PASSED")});
  EXPECT_EQ(m.state(), SessionStatus::kQaPassed);
  const auto snap = m.Snapshot();
  EXPECT_EQ(snap.reopen_total, 1u);
  EXPECT_EQ(snap.illegal_transition_total, 0u);
}

TEST(SessionStateMachineContract, ReplaySkipsIllegalAndUnknownRecords) {
  SessionStateMachine m;
  m.Replay({Rec("PENDING"), Rec("ASSEMBLED"), Rec("BOGUS"), Rec("CANDIDATES_READY"),
            Rec("PENDING", /*reopen=*/true)});
  EXPECT_EQ(m.state(), SessionStatus::kCandidatesReady);
  EXPECT_EQ(m.Snapshot().illegal_transition_total, 3u);
}

}  // namespace
}  // namespace narrovault::session
