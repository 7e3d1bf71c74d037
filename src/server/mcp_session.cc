#define MCPGATE_LOG_COMPONENT "server.session"

#include "mcpgate/server/mcp_session.h"

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace server {

namespace {

constexpr size_t kFrameLogChars = 100;

const char* const kToolFailureMessage =
    "Tool execution failed. Please check your authentication and try again.";

}  // namespace

McpSession::McpSession(const std::string& session_id,
                       const std::string& client_id,
                       event::DispatcherBase& dispatcher,
                       const ToolRegistry& registry,
                       const protocol::EnvelopeCodec& codec,
                       FrameSink& sink)
    : session_id_(session_id),
      client_id_(client_id),
      dispatcher_(dispatcher),
      registry_(registry),
      codec_(codec),
      sink_(sink) {
  log_context_.session_id = session_id_;
  log_context_.client_id = client_id_;
  log_context_.component = logging::Component::Protocol;
}

McpSession::~McpSession() {
  if (!state_machine_.isClosed()) {
    state_machine_.handleEvent(protocol::SessionEvent::ShutdownRequested,
                               "session destroyed");
  }
}

bool McpSession::authenticate(const auth::AccessGuard& guard,
                              const std::string& presented) {
  if (state_machine_.currentState() !=
      protocol::SessionState::Unauthenticated) {
    return state_machine_.isAuthenticated();
  }
  if (!guard.authorize(presented)) {
    MCPGATE_LOG(Warning, "Unauthorized WebSocket connection attempt from {}",
                client_id_);
    state_machine_.handleEvent(protocol::SessionEvent::CredentialRejected,
                               kUnauthorizedReason);
    return false;
  }
  state_machine_.handleEvent(protocol::SessionEvent::CredentialAccepted);
  MCPGATE_LOG_WITH_CONTEXT(Info, log_context_,
                           "Authorized MCP WebSocket connection from {}",
                           client_id_);
  return true;
}

void McpSession::onFrame(const std::string& payload) {
  if (!isOpen()) {
    MCPGATE_LOG(Debug, "Dropping frame on session {} in state {}",
                session_id_,
                protocol::SessionStateMachine::stateToString(state()));
    return;
  }
  ++stats_.frames_received;
  MCPGATE_LOG(Debug, "Received MCP message: {}...",
              payload.substr(0, kFrameLogChars));
  if (pending_frames_.size() >= kMaxQueuedFrames ||
      pending_bytes_ + payload.size() > kMaxQueuedBytes) {
    MCPGATE_LOG_WITH_CONTEXT(
        Warning, log_context_,
        "Closing session from {}: {} frames ({} bytes) queued behind a tool "
        "call",
        client_id_, pending_frames_.size(), pending_bytes_);
    sink_.closeForPolicyViolation("too many queued messages");
    close(protocol::SessionEvent::TransportFault, "too many queued messages");
    return;
  }
  pending_bytes_ += payload.size();
  pending_frames_.push_back(payload);
  drain();
}

void McpSession::drain() {
  if (draining_) {
    return;
  }
  draining_ = true;
  while (!call_in_flight_ && isOpen() && !pending_frames_.empty()) {
    std::string frame = std::move(pending_frames_.front());
    pending_frames_.pop_front();
    pending_bytes_ -= frame.size();
    handleFrame(frame);
  }
  draining_ = false;
}

void McpSession::setCallInFlight(bool in_flight) {
  if (call_in_flight_ == in_flight) {
    return;
  }
  call_in_flight_ = in_flight;
  if (isOpen()) {
    sink_.pauseReading(in_flight);
  }
}

void McpSession::handleFrame(const std::string& payload) {
  auto decoded = codec_.decode(payload);

  if (auto* failure = std::get_if<protocol::DecodeFailure>(&decoded)) {
    MCPGATE_LOG(Error, "{} from {}: {}",
                protocol::decodeErrorKindName(failure->kind), client_id_,
                failure->detail);
    if (failure->kind == protocol::DecodeErrorKind::MalformedSyntax) {
      sendError(nullptr, jsonrpc::PARSE_ERROR, "Invalid JSON format");
    } else {
      sendError(failure->id, jsonrpc::INVALID_PARAMS,
                "Invalid request format");
    }
    return;
  }

  const auto& request = std::get<protocol::RequestEnvelope>(decoded);
  try {
    dispatch(request);
  } catch (const std::exception& e) {
    // Per-frame fault: answer and keep the channel open
    MCPGATE_LOG(Error, "Unexpected error from {}: {}", client_id_, e.what());
    setCallInFlight(false);
    sendError(request.id, jsonrpc::INTERNAL_ERROR, "Internal server error");
  }
}

void McpSession::dispatch(const protocol::RequestEnvelope& request) {
  if (request.method == "initialize") {
    sendResult(request.id, initializeResult());
  } else if (request.method == "tools/list") {
    sendResult(request.id, listToolsResult());
  } else if (request.method == "tools/call") {
    callTool(request);
  } else {
    MCPGATE_LOG(Info, "Method not found: {}", request.method);
    sendError(request.id, jsonrpc::METHOD_NOT_FOUND,
              "Method not found: " + request.method);
  }
}

nlohmann::json McpSession::initializeResult() const {
  return {{"protocolVersion", protocol_info::PROTOCOL_VERSION},
          {"capabilities",
           {{"tools", nlohmann::json::object()},
            {"prompts", nlohmann::json::object()},
            {"resources", nlohmann::json::object()}}},
          {"serverInfo",
           {{"name", protocol_info::SERVER_NAME},
            {"version", protocol_info::SERVER_VERSION}}}};
}

nlohmann::json McpSession::listToolsResult() const {
  auto tools = nlohmann::json::array();
  for (const auto& tool : registry_.list()) {
    tools.push_back({{"name", tool.name},
                     {"description", tool.description},
                     {"inputSchema", tool.input_schema}});
  }
  return {{"tools", std::move(tools)}};
}

void McpSession::callTool(const protocol::RequestEnvelope& request) {
  auto name_it = request.params.find("name");
  if (name_it == request.params.end() || !name_it->is_string()) {
    MCPGATE_LOG(Error, "tools/call from {} without a tool name", client_id_);
    sendError(request.id, jsonrpc::INVALID_PARAMS, "Invalid request format");
    return;
  }
  std::string name = name_it->get<std::string>();

  nlohmann::json arguments = nlohmann::json::object();
  auto args_it = request.params.find("arguments");
  if (args_it != request.params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      MCPGATE_LOG(Error, "tools/call {} with non-object arguments", name);
      sendError(request.id, jsonrpc::INVALID_PARAMS, "Invalid request format");
      return;
    }
    arguments = *args_it;
  }

  ++stats_.tool_calls;
  setCallInFlight(true);

  logging::LogContext context = log_context_;
  context.mcp_method = request.method;
  context.mcp_tool = name;
  context.request_id = requestIdToString(request.id);
  MCPGATE_LOG_WITH_CONTEXT(Info, context, "Calling tool {}", name);

  std::weak_ptr<McpSession> weak_self = shared_from_this();
  event::DispatcherBase* dispatcher = &dispatcher_;
  RequestId id = request.id;

  // May run on a worker thread; everything else happens on the dispatcher
  registry_.invoke(name, arguments,
                   [weak_self, dispatcher, id](ToolOutcome outcome) {
                     dispatcher->post([weak_self, id,
                                       outcome = std::move(outcome)]() {
                       auto self = weak_self.lock();
                       if (!self || !self->isOpen()) {
                         MCPGATE_LOG(Debug,
                                     "Discarding tool result for closed "
                                     "session");
                         return;
                       }
                       self->finishToolCall(id, outcome);
                     });
                   });
}

void McpSession::finishToolCall(const RequestId& id, ToolOutcome outcome) {
  setCallInFlight(false);

  if (auto* success = std::get_if<ToolSuccess>(&outcome)) {
    std::string text = success->value.is_string()
                           ? success->value.get<std::string>()
                           : success->value.dump(
                                 -1, ' ', false,
                                 nlohmann::json::error_handler_t::replace);
    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "text"}, {"text", std::move(text)}});
    sendResult(id, {{"content", std::move(content)}});
  } else if (auto* missing = std::get_if<ToolNotFound>(&outcome)) {
    sendError(id, jsonrpc::METHOD_NOT_FOUND,
              "Tool not found: " + missing->name);
  } else {
    ++stats_.tool_failures;
    sendError(id, jsonrpc::INTERNAL_ERROR, kToolFailureMessage);
  }

  drain();
}

void McpSession::sendResult(const RequestId& id, nlohmann::json result) {
  send(protocol::ResponseEnvelope::success(id, std::move(result)));
}

void McpSession::sendError(const RequestId& id,
                           int code,
                           const std::string& message) {
  ++stats_.errors_sent;
  send(protocol::ResponseEnvelope::failure(id, code, message));
}

void McpSession::send(const protocol::ResponseEnvelope& response) {
  ++stats_.responses_sent;
  sink_.sendText(codec_.encode(response));
}

void McpSession::close(protocol::SessionEvent event,
                       const std::string& reason) {
  if (state_machine_.isClosed()) {
    return;
  }
  bool was_open = isOpen();
  auto lifetime = state_machine_.timeInCurrentState();
  state_machine_.handleEvent(event, reason);
  pending_frames_.clear();
  pending_bytes_ = 0;
  if (was_open) {
    MCPGATE_LOG_WITH_CONTEXT(
        Info, log_context_,
        "MCP WebSocket connection closed ({}) after {} ms: frames={} "
        "responses={} errors={} tool_calls={} tool_failures={}",
        reason.empty() ? "closed" : reason, lifetime.count(),
        stats_.frames_received,
        stats_.responses_sent, stats_.errors_sent, stats_.tool_calls,
        stats_.tool_failures);
  }
}

}  // namespace server
}  // namespace mcpgate
