/**
 * @file mcp_session.h
 * @brief One authenticated channel and its ordered frame loop
 */
#ifndef MCPGATE_SERVER_MCP_SESSION_H
#define MCPGATE_SERVER_MCP_SESSION_H

#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "mcpgate/auth/access_guard.h"
#include "mcpgate/event/event_loop.h"
#include "mcpgate/logging/log_message.h"
#include "mcpgate/protocol/envelope_codec.h"
#include "mcpgate/protocol/session_state_machine.h"
#include "mcpgate/server/tool_registry.h"

namespace mcpgate {
namespace server {

/**
 * Transport side of the channel. The websocket connection implements it in
 * production; tests use an in-memory sink.
 */
class FrameSink {
 public:
  virtual ~FrameSink() = default;

  virtual void sendText(const std::string& payload) = 0;

  // Stop delivering inbound frames while a tool call is in flight
  virtual void pauseReading(bool paused) = 0;

  // Close the channel with a policy-violation code
  virtual void closeForPolicyViolation(const std::string& reason) = 0;
};

struct SessionStats {
  uint64_t frames_received{0};
  uint64_t responses_sent{0};
  uint64_t errors_sent{0};
  uint64_t tool_calls{0};
  uint64_t tool_failures{0};
};

/**
 * Processes frames strictly in arrival order: a frame is not decoded until
 * the previous one has been answered. While a tool call is in flight the
 * sink is asked to pause reading; frames already decoded by the transport
 * are queued up to kMaxQueuedFrames / kMaxQueuedBytes, beyond which the
 * channel is closed.
 *
 * Lives on one dispatcher thread. Async tool completions are posted back to
 * that dispatcher and dropped if the session has closed in the meantime.
 * Create with std::make_shared.
 */
class McpSession : public std::enable_shared_from_this<McpSession> {
 public:
  static constexpr const char* kUnauthorizedReason =
      "Unauthorized: Valid X-API-Key header required";
  static constexpr size_t kMaxQueuedFrames = 256;
  static constexpr size_t kMaxQueuedBytes = 4 * 1024 * 1024;

  McpSession(const std::string& session_id,
             const std::string& client_id,
             event::DispatcherBase& dispatcher,
             const ToolRegistry& registry,
             const protocol::EnvelopeCodec& codec,
             FrameSink& sink);
  ~McpSession();

  /**
   * Check the credential presented at upgrade. On failure the session goes
   * straight to Closed and never processes a frame.
   */
  bool authenticate(const auth::AccessGuard& guard,
                    const std::string& presented);

  // Inbound text or binary message
  void onFrame(const std::string& payload);

  // Transport went away. Idempotent.
  void close(protocol::SessionEvent event, const std::string& reason);

  protocol::SessionState state() const { return state_machine_.currentState(); }
  bool isOpen() const { return state_machine_.isAuthenticated(); }
  bool toolCallInFlight() const { return call_in_flight_; }
  size_t queuedFrames() const { return pending_frames_.size(); }
  size_t queuedBytes() const { return pending_bytes_; }
  const SessionStats& stats() const { return stats_; }
  const std::string& id() const { return session_id_; }

 private:
  void drain();
  void setCallInFlight(bool in_flight);
  void handleFrame(const std::string& payload);
  void dispatch(const protocol::RequestEnvelope& request);

  nlohmann::json initializeResult() const;
  nlohmann::json listToolsResult() const;
  void callTool(const protocol::RequestEnvelope& request);
  void finishToolCall(const RequestId& id, ToolOutcome outcome);

  void sendResult(const RequestId& id, nlohmann::json result);
  void sendError(const RequestId& id, int code, const std::string& message);
  void send(const protocol::ResponseEnvelope& response);

  std::string session_id_;
  std::string client_id_;
  event::DispatcherBase& dispatcher_;
  const ToolRegistry& registry_;
  const protocol::EnvelopeCodec& codec_;
  FrameSink& sink_;

  protocol::SessionStateMachine state_machine_;
  logging::LogContext log_context_;
  std::deque<std::string> pending_frames_;
  size_t pending_bytes_{0};
  bool call_in_flight_{false};
  bool draining_{false};
  SessionStats stats_;
};

using McpSessionSharedPtr = std::shared_ptr<McpSession>;

}  // namespace server
}  // namespace mcpgate

#endif  // MCPGATE_SERVER_MCP_SESSION_H
