#include <vector>

#include <gtest/gtest.h>

#include "mcpgate/protocol/session_state_machine.h"

namespace mcpgate {
namespace protocol {
namespace {

class SessionStateMachineTest : public ::testing::Test {
 protected:
  SessionStateMachineTest()
      : machine_([this](const SessionTransition& transition) {
          transitions_.push_back(transition);
        }) {}

  std::vector<SessionTransition> transitions_;
  SessionStateMachine machine_;
};

TEST_F(SessionStateMachineTest, StartsUnauthenticated) {
  EXPECT_EQ(machine_.currentState(), SessionState::Unauthenticated);
  EXPECT_FALSE(machine_.isAuthenticated());
  EXPECT_FALSE(machine_.isClosed());
}

TEST_F(SessionStateMachineTest, AcceptThenPeerClose) {
  EXPECT_TRUE(machine_.handleEvent(SessionEvent::CredentialAccepted));
  EXPECT_TRUE(machine_.isAuthenticated());

  EXPECT_TRUE(machine_.handleEvent(SessionEvent::PeerClosed, "bye"));
  EXPECT_TRUE(machine_.isClosed());
  EXPECT_EQ(machine_.closeReason(), "bye");

  ASSERT_EQ(transitions_.size(), 2u);
  EXPECT_EQ(transitions_[0].from_state, SessionState::Unauthenticated);
  EXPECT_EQ(transitions_[0].to_state, SessionState::Authenticated);
  EXPECT_EQ(transitions_[1].trigger_event, SessionEvent::PeerClosed);
  EXPECT_EQ(transitions_[1].reason, "bye");
}

TEST_F(SessionStateMachineTest, RejectedCredentialCloses) {
  EXPECT_TRUE(machine_.handleEvent(SessionEvent::CredentialRejected,
                                   "Unauthorized"));
  EXPECT_TRUE(machine_.isClosed());
  EXPECT_EQ(machine_.closeReason(), "Unauthorized");

  // Cannot authenticate after refusal
  EXPECT_FALSE(machine_.handleEvent(SessionEvent::CredentialAccepted));
  EXPECT_TRUE(machine_.isClosed());
}

TEST_F(SessionStateMachineTest, ClosedIsTerminal) {
  machine_.handleEvent(SessionEvent::CredentialAccepted);
  machine_.handleEvent(SessionEvent::TransportFault, "reset");

  for (auto event :
       {SessionEvent::CredentialAccepted, SessionEvent::CredentialRejected,
        SessionEvent::PeerClosed, SessionEvent::TransportFault,
        SessionEvent::ShutdownRequested}) {
    EXPECT_FALSE(machine_.handleEvent(event));
    EXPECT_TRUE(machine_.isClosed());
  }
  EXPECT_EQ(machine_.closeReason(), "reset");
  EXPECT_EQ(transitions_.size(), 2u);
}

TEST_F(SessionStateMachineTest, CredentialEventsIgnoredWhenAuthenticated) {
  machine_.handleEvent(SessionEvent::CredentialAccepted);

  EXPECT_FALSE(machine_.handleEvent(SessionEvent::CredentialAccepted));
  EXPECT_FALSE(machine_.handleEvent(SessionEvent::CredentialRejected));
  EXPECT_TRUE(machine_.isAuthenticated());
}

TEST_F(SessionStateMachineTest, ShutdownBeforeAuthenticationCloses) {
  EXPECT_TRUE(machine_.handleEvent(SessionEvent::ShutdownRequested));
  EXPECT_TRUE(machine_.isClosed());
}

TEST_F(SessionStateMachineTest, Names) {
  EXPECT_STREQ(SessionStateMachine::stateToString(SessionState::Closed),
               "Closed");
  EXPECT_STREQ(
      SessionStateMachine::eventToString(SessionEvent::ShutdownRequested),
      "ShutdownRequested");
}

}  // namespace
}  // namespace protocol
}  // namespace mcpgate
