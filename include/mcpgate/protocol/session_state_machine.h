/**
 * Session lifecycle state machine
 *
 * Unauthenticated -> Authenticated -> Closed, or Unauthenticated -> Closed
 * when the credential is refused. Closed is terminal. All methods must be
 * called from the owning dispatcher thread.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace mcpgate {
namespace protocol {

enum class SessionState {
  // Connection accepted, credential not yet checked
  Unauthenticated,

  // Credential accepted, frames are processed
  Authenticated,

  // Terminal
  Closed
};

enum class SessionEvent {
  CredentialAccepted,
  CredentialRejected,
  PeerClosed,       // close frame or orderly disconnect
  TransportFault,   // read/write error or framing violation
  ShutdownRequested
};

struct SessionTransition {
  SessionState from_state;
  SessionState to_state;
  SessionEvent trigger_event;
  std::chrono::steady_clock::time_point timestamp;
  std::string reason;
};

class SessionStateMachine {
 public:
  using TransitionCallback = std::function<void(const SessionTransition&)>;

  explicit SessionStateMachine(TransitionCallback callback = nullptr);

  SessionState currentState() const { return current_state_; }
  bool isAuthenticated() const {
    return current_state_ == SessionState::Authenticated;
  }
  bool isClosed() const { return current_state_ == SessionState::Closed; }

  /**
   * Apply an event. Returns false and leaves the state unchanged when the
   * event is not valid in the current state.
   */
  bool handleEvent(SessionEvent event, const std::string& reason = "");

  // Reason recorded by the transition into Closed
  const std::string& closeReason() const { return close_reason_; }

  std::chrono::milliseconds timeInCurrentState() const;

  static const char* stateToString(SessionState state);
  static const char* eventToString(SessionEvent event);

 private:
  void transitionTo(SessionState new_state,
                    SessionEvent event,
                    const std::string& reason);

  TransitionCallback callback_;
  SessionState current_state_{SessionState::Unauthenticated};
  std::chrono::steady_clock::time_point state_entry_time_;
  std::string close_reason_;
};

}  // namespace protocol
}  // namespace mcpgate
