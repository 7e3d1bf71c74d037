#define MCPGATE_LOG_COMPONENT "server.gateway"

#include "mcpgate/server/gateway_server.h"

#include <algorithm>
#include <unistd.h>

#include <fmt/format.h>

#include "mcpgate/logging/log_macros.h"
#include "mcpgate/types.h"

namespace mcpgate {
namespace server {

using http::HttpResponse;
using nlohmann::json;

namespace {

const char* const kRateLimitMessage =
    "Rate limit exceeded. Please try again later.";
const char* const kUnauthorizedMessage =
    "Unauthorized. Valid X-API-Key header required.";

bool isKnownPath(const std::string& path) {
  return path == "/" || path == "/health" || path == "/tools" ||
         path == "/auth" || path == "/mcp" || path == "/whoop/auth" ||
         path == "/whoop/callback";
}

std::string trimWhitespace(const std::string& text) {
  auto begin = text.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = text.find_last_not_of(" \t");
  return text.substr(begin, end - begin + 1);
}

filter::RateLimitConfig rateLimitConfig(const config::ServerConfig& config) {
  filter::RateLimitConfig limits;
  limits.max_requests_per_window = config.rate_limit.max_requests;
  limits.window_size = config.rate_limit.window;
  return limits;
}

protocol::CodecLimits codecLimits(const config::ServerConfig& config) {
  protocol::CodecLimits limits;
  limits.max_message_bytes = config.max_message_bytes;
  limits.max_method_length = config.max_method_length;
  return limits;
}

json fieldOrNull(const json& object, const char* key) {
  auto it = object.find(key);
  return it == object.end() ? json() : *it;
}

}  // namespace

std::string clientIdentity(const http::HttpRequest& request,
                           const std::string& peer_address) {
  std::string forwarded = request.header("X-Forwarded-For");
  if (!forwarded.empty()) {
    std::string first = trimWhitespace(forwarded.substr(0, forwarded.find(',')));
    if (!first.empty()) {
      return first;
    }
  }
  return peer_address.empty() ? "unknown" : peer_address;
}

GatewayServer::GatewayServer(const GatewayContext& context)
    : context_(context),
      guard_(context.config.api_secret_key),
      rate_limiter_(rateLimitConfig(context.config)),
      codec_(codecLimits(context.config)),
      listener_(context.dispatcher, *this),
      alive_(std::make_shared<bool>(true)) {}

GatewayServer::~GatewayServer() { shutdown(); }

void GatewayServer::start() {
  listener_.listen(context_.config.host, context_.config.port);

  prune_timer_ = context_.dispatcher.createTimer([this]() {
    size_t pruned = rate_limiter_.pruneIdleClients();
    if (pruned > 0) {
      MCPGATE_LOG(Debug, "Pruned {} idle rate-limit windows", pruned);
    }
    schedulePrune();
  });
  schedulePrune();

  MCPGATE_LOG(Info, "Starting WHOOP MCP gateway on {}:{} ({} tools)",
              context_.config.host, listener_.localPort(),
              context_.registry.size());
}

void GatewayServer::schedulePrune() {
  if (prune_timer_ && !shutting_down_) {
    prune_timer_->enableTimer(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            rate_limiter_.config().window_size));
  }
}

void GatewayServer::shutdown() {
  if (shutting_down_) {
    return;
  }
  shutting_down_ = true;

  if (prune_timer_) {
    prune_timer_->disableTimer();
  }
  listener_.close();

  // Close callbacks re-enter removeConnection() and find nothing to remove
  auto connections = std::move(connections_);
  connections_.clear();
  for (auto& entry : connections) {
    entry.second->shutdown();
  }
  MCPGATE_LOG(Info, "Gateway stopped, {} connections closed",
              connections.size());
}

size_t GatewayServer::activeSessions() const {
  return std::count_if(
      connections_.begin(), connections_.end(), [](const auto& entry) {
        const auto& session = entry.second->session();
        return session && session->isOpen();
      });
}

void GatewayServer::onAccept(int fd, const std::string& peer_address) {
  if (shutting_down_) {
    ::close(fd);
    return;
  }
  uint64_t id = next_connection_id_++;
  auto tcp = std::make_unique<network::TcpConnection>(context_.dispatcher, fd,
                                                      peer_address, id);
  connections_[id] = std::make_unique<GatewayConnection>(*this, std::move(tcp));
  MCPGATE_LOG(Debug, "Accepted connection {} from {}", id, peer_address);
}

void GatewayServer::removeConnection(uint64_t id) {
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return;
  }
  event::DeferredDeletablePtr connection(std::move(it->second));
  connections_.erase(it);
  context_.dispatcher.deferredDelete(std::move(connection));
}

void GatewayServer::handleRequest(GatewayConnection& connection,
                                  const http::HttpRequest& request) {
  const std::string client = clientIdentity(request, connection.peerAddress());
  connection.setClientId(client);
  MCPGATE_LOG(Info, "{} {} from {}", request.method, request.path, client);

  if (rate_limiter_.isLimited(client)) {
    auto retry = rate_limiter_.retryAfter(client);
    int64_t seconds = std::max<int64_t>(1, (retry.count() + 999) / 1000);
    MCPGATE_LOG(Warning, "Rate limit exceeded for {}", client);
    auto response = HttpResponse::json(429, {{"error", kRateLimitMessage}});
    response.setHeader("Retry-After", std::to_string(seconds));
    connection.respond(std::move(response));
    return;
  }

  // The upgrade credential is checked by the session so that a refusal
  // never leaves Unauthenticated for Authenticated
  const bool upgrade_attempt =
      request.method == "GET" && request.path == "/mcp" && request.upgrade;
  if (!upgrade_attempt &&
      auth::AccessGuard::requiresCredential(request.path)) {
    if (!guard_.authorize(request.header("X-API-Key"))) {
      MCPGATE_LOG(Warning, "Unauthorized access attempt to {} from {}",
                  request.path, client);
      connection.respond(
          HttpResponse::json(401, {{"error", kUnauthorizedMessage}}));
      return;
    }
    MCPGATE_LOG(Info, "Authorized access to {} from {}", request.path,
                client);
  }

  if (!isKnownPath(request.path)) {
    connection.respond(HttpResponse::json(404, {{"error", "Not found"}}));
    return;
  }
  if (request.method != "GET") {
    auto response =
        HttpResponse::json(405, {{"error", "Method not allowed"}});
    response.setHeader("Allow", "GET");
    connection.respond(std::move(response));
    return;
  }

  try {
    const std::string& path = request.path;
    if (path == "/health") {
      connection.respond(HttpResponse::json(
          200, {{"status", "healthy"},
                {"service", protocol_info::SERVER_NAME}}));
    } else if (path == "/") {
      connection.respond(serviceInfo());
    } else if (path == "/tools") {
      connection.respond(listTools());
    } else if (path == "/auth") {
      connection.respond(authStatus());
    } else if (path == "/whoop/auth") {
      connection.respond(startOAuth());
    } else if (path == "/whoop/callback") {
      handleOAuthCallback(connection, request);
    } else if (upgrade_attempt) {
      handleUpgrade(connection, request);
    } else {
      connection.respond(HttpResponse::json(
          400, {{"error", "WebSocket upgrade required"}}));
    }
  } catch (const std::exception& e) {
    MCPGATE_LOG(Error, "Error handling {} {}: {}", request.method,
                request.path, e.what());
    connection.respond(
        HttpResponse::json(500, {{"error", "Internal server error"}}));
  }
}

HttpResponse GatewayServer::serviceInfo() const {
  const auto& rate = context_.config.rate_limit;
  json body = {
      {"name", "WHOOP MCP Server"},
      {"version", protocol_info::SERVER_VERSION},
      {"description",
       "WHOOP Model Context Protocol Server with enhanced API v2 features"},
      {"security",
       {{"protected_endpoints", {"/mcp", "/auth", "/tools"}},
        {"authentication",
         "X-API-Key header required for protected endpoints"},
        {"rate_limit", fmt::format("{} requests per {} seconds",
                                   rate.max_requests, rate.window.count())}}},
      {"endpoints",
       {{"health", "/health (public)"},
        {"mcp_ws", "/mcp (protected - requires X-API-Key)"},
        {"tools", "/tools (protected - requires X-API-Key)"},
        {"auth", "/auth (protected - requires X-API-Key)"},
        {"whoop_auth", "/whoop/auth (public)"}}},
      {"usage",
       {{"authentication",
         "Include 'X-API-Key: your-api-key' header for protected endpoints"},
        {"websocket",
         "Connect to /mcp with X-API-Key header for MCP communication"}}}};
  return HttpResponse::json(200, body);
}

HttpResponse GatewayServer::listTools() const {
  json tools = json::array();
  for (const auto& tool : context_.registry.list()) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}});
  }
  return HttpResponse::json(200, {{"tools", tools}});
}

HttpResponse GatewayServer::authStatus() const {
  return HttpResponse::json(200, context_.token_store.status());
}

HttpResponse GatewayServer::startOAuth() {
  if (!context_.oauth.configured()) {
    MCPGATE_LOG(Error, "WHOOP OAuth requested but no client id configured");
    return HttpResponse::json(
        500,
        {{"error", "WHOOP client ID not configured"},
         {"message", "Server configuration error. Please contact administrator."}});
  }
  auto start = context_.oauth.begin();
  return HttpResponse::json(
      200, {{"auth_url", start.auth_url},
            {"state", start.state},
            {"instructions", "Visit the auth_url to authenticate with WHOOP"},
            {"callback_uri", start.callback_uri}});
}

void GatewayServer::handleOAuthCallback(GatewayConnection& connection,
                                        const http::HttpRequest& request) {
  auto params = request.queryParams();

  auto error = params.find("error");
  if (error != params.end()) {
    MCPGATE_LOG(Error, "WHOOP OAuth error: {}", error->second);
    connection.respond(HttpResponse::json(
        400, {{"error", "WHOOP authentication failed"},
              {"details", error->second},
              {"message", "Please try authenticating again"}}));
    return;
  }

  auto code = params.find("code");
  if (code == params.end() || code->second.empty()) {
    MCPGATE_LOG(Error, "No authorization code received from WHOOP");
    connection.respond(HttpResponse::json(
        400, {{"error", "Missing authorization code"},
              {"message", "Please start the authentication process again"}}));
    return;
  }

  auto state = params.find("state");
  if (state == params.end() || !context_.oauth.acceptState(state->second)) {
    MCPGATE_LOG(Warning, "OAuth callback with unknown state from {}",
                connection.clientId());
    connection.respond(HttpResponse::json(
        400, {{"error", "Invalid OAuth state"},
              {"message", "Please start the authentication process again"}}));
    return;
  }

  connection.setMode(GatewayConnection::Mode::AwaitingWorker);
  std::weak_ptr<bool> alive = alive_;
  uint64_t id = connection.id();
  auth::OAuthFlow& oauth = context_.oauth;
  event::Dispatcher& dispatcher = context_.dispatcher;
  std::string auth_code = code->second;

  bool queued = context_.workers.submit(
      [this, alive, id, auth_code, &oauth, &dispatcher]() {
        auto result = oauth.exchangeCode(auth_code);
        dispatcher.post([this, alive, id, result]() {
          if (!alive.lock()) {
            return;
          }
          finishOAuthCallback(id, result);
        });
      });
  if (!queued) {
    MCPGATE_LOG(Error, "Worker pool stopped; cannot exchange OAuth code");
    connection.respond(HttpResponse::json(
        503, {{"error", "Service unavailable"}}));
  }
}

void GatewayServer::finishOAuthCallback(
    uint64_t connection_id,
    const auth::TokenExchangeResult& result) {
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    MCPGATE_LOG(Debug, "OAuth callback connection {} went away before the "
                       "token exchange finished",
                connection_id);
    return;
  }
  GatewayConnection& connection = *it->second;

  switch (result.outcome) {
    case auth::TokenExchangeResult::Outcome::Success:
      connection.respond(HttpResponse::json(
          200,
          {{"success", true},
           {"message", "WHOOP authentication successful!"},
           {"token_type", fieldOrNull(result.token, "token_type")},
           {"expires_in", fieldOrNull(result.token, "expires_in")},
           {"instructions",
            "You can now close this tab and use WHOOP tools in your MCP "
            "client."}}));
      return;
    case auth::TokenExchangeResult::Outcome::Rejected:
      connection.respond(HttpResponse::json(
          400,
          {{"error", "Token exchange failed"},
           {"status_code", result.status_code},
           {"message",
            "Failed to exchange authorization code for access token"}}));
      return;
    case auth::TokenExchangeResult::Outcome::Failed:
      connection.respond(HttpResponse::json(
          500, {{"error", "Authentication processing failed"},
                {"message",
                 "An error occurred while processing the authentication"}}));
      return;
  }
}

void GatewayServer::handleUpgrade(GatewayConnection& connection,
                                  const http::HttpRequest& request) {
  const std::string key = request.header("Sec-WebSocket-Key");
  if (!request.headerContainsToken("Upgrade", "websocket") ||
      !websocket::isValidClientKey(key)) {
    connection.respond(HttpResponse::json(
        400, {{"error", "Invalid WebSocket upgrade request"}}));
    return;
  }
  if (request.header("Sec-WebSocket-Version") != websocket::kWebSocketVersion) {
    auto response =
        HttpResponse::json(426, {{"error", "Unsupported WebSocket version"}});
    response.setHeader("Sec-WebSocket-Version", websocket::kWebSocketVersion);
    connection.respond(std::move(response));
    return;
  }

  auto session = std::make_shared<McpSession>(
      "ws-" + std::to_string(next_session_id_++), connection.clientId(),
      context_.dispatcher, context_.registry, codec_, connection);
  if (!session->authenticate(guard_, request.header("X-API-Key"))) {
    connection.respond(HttpResponse::json(
        401, {{"error", McpSession::kUnauthorizedReason}}));
    return;
  }
  connection.upgrade(std::move(session),
                     websocket::computeAcceptKey(key));
}

}  // namespace server
}  // namespace mcpgate
