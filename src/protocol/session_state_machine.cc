#define MCPGATE_LOG_COMPONENT "protocol.session"

#include "mcpgate/protocol/session_state_machine.h"

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace protocol {

SessionStateMachine::SessionStateMachine(TransitionCallback callback)
    : callback_(std::move(callback)),
      state_entry_time_(std::chrono::steady_clock::now()) {}

bool SessionStateMachine::handleEvent(SessionEvent event,
                                      const std::string& reason) {
  SessionState current = current_state_;
  SessionState new_state = current;

  switch (current) {
    case SessionState::Unauthenticated:
      if (event == SessionEvent::CredentialAccepted) {
        new_state = SessionState::Authenticated;
      } else {
        // Refusal, disconnect or shutdown before the upgrade completed
        new_state = SessionState::Closed;
      }
      break;

    case SessionState::Authenticated:
      if (event == SessionEvent::PeerClosed ||
          event == SessionEvent::TransportFault ||
          event == SessionEvent::ShutdownRequested) {
        new_state = SessionState::Closed;
      }
      break;

    case SessionState::Closed:
      break;
  }

  if (new_state == current) {
    MCPGATE_LOG(Debug, "Ignoring event {} in state {}", eventToString(event),
                stateToString(current));
    return false;
  }

  transitionTo(new_state, event, reason);
  return true;
}

void SessionStateMachine::transitionTo(SessionState new_state,
                                       SessionEvent event,
                                       const std::string& reason) {
  SessionState old_state = current_state_;
  current_state_ = new_state;
  state_entry_time_ = std::chrono::steady_clock::now();
  if (new_state == SessionState::Closed) {
    close_reason_ = reason;
  }

  MCPGATE_LOG(Debug, "Session {} -> {} on {}{}{}", stateToString(old_state),
              stateToString(new_state), eventToString(event),
              reason.empty() ? "" : ": ", reason);

  if (callback_) {
    SessionTransition transition;
    transition.from_state = old_state;
    transition.to_state = new_state;
    transition.trigger_event = event;
    transition.timestamp = state_entry_time_;
    transition.reason = reason;
    callback_(transition);
  }
}

std::chrono::milliseconds SessionStateMachine::timeInCurrentState() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - state_entry_time_);
}

const char* SessionStateMachine::stateToString(SessionState state) {
  switch (state) {
    case SessionState::Unauthenticated:
      return "Unauthenticated";
    case SessionState::Authenticated:
      return "Authenticated";
    case SessionState::Closed:
      return "Closed";
  }
  return "Unknown";
}

const char* SessionStateMachine::eventToString(SessionEvent event) {
  switch (event) {
    case SessionEvent::CredentialAccepted:
      return "CredentialAccepted";
    case SessionEvent::CredentialRejected:
      return "CredentialRejected";
    case SessionEvent::PeerClosed:
      return "PeerClosed";
    case SessionEvent::TransportFault:
      return "TransportFault";
    case SessionEvent::ShutdownRequested:
      return "ShutdownRequested";
  }
  return "Unknown";
}

}  // namespace protocol
}  // namespace mcpgate
