/**
 * @file gateway_server.h
 * @brief HTTP boundary and websocket upgrade for the MCP gateway
 *
 * Every accepted socket starts as a one-shot HTTP/1.1 exchange. The
 * request goes through client identity, rate limiting and the access
 * guard before it is routed. A valid GET /mcp upgrade hands the socket to
 * an McpSession for the rest of its life.
 *
 * All methods run on the dispatcher thread.
 */
#ifndef MCPGATE_SERVER_GATEWAY_SERVER_H
#define MCPGATE_SERVER_GATEWAY_SERVER_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "mcpgate/auth/access_guard.h"
#include "mcpgate/auth/oauth_flow.h"
#include "mcpgate/auth/token_store.h"
#include "mcpgate/config/server_config.h"
#include "mcpgate/event/event_loop.h"
#include "mcpgate/event/worker_pool.h"
#include "mcpgate/filter/rate_limiter.h"
#include "mcpgate/http/http_message.h"
#include "mcpgate/http/request_parser.h"
#include "mcpgate/network/connection.h"
#include "mcpgate/network/listener.h"
#include "mcpgate/protocol/envelope_codec.h"
#include "mcpgate/server/mcp_session.h"
#include "mcpgate/server/tool_registry.h"
#include "mcpgate/websocket/websocket_codec.h"

namespace mcpgate {
namespace server {

class GatewayServer;

/**
 * First comma-separated entry of X-Forwarded-For, else the socket peer,
 * else "unknown". Only used as a rate-limit key.
 */
std::string clientIdentity(const http::HttpRequest& request,
                           const std::string& peer_address);

/**
 * One accepted socket. Speaks HTTP until it answers a single request, or
 * switches to websocket framing after a successful /mcp upgrade.
 */
class GatewayConnection : public event::DeferredDeletable,
                          public network::ConnectionCallbacks,
                          public websocket::FrameParserCallbacks,
                          public FrameSink {
 public:
  enum class Mode {
    Http,            // reading the request
    AwaitingWorker,  // request handed to the worker pool
    WebSocket,       // upgraded, owned by the session
    Done             // response written or channel closed
  };

  GatewayConnection(GatewayServer& server, network::TcpConnectionPtr tcp);
  ~GatewayConnection() override;

  // network::ConnectionCallbacks
  void onData(const char* data, size_t length) override;
  void onEvent(network::ConnectionEvent event) override;

  // websocket::FrameParserCallbacks
  void onMessage(const std::string& payload, bool binary) override;
  void onPing(const std::string& payload) override;
  void onClose(uint16_t code, const std::string& reason) override;
  void onProtocolError(uint16_t close_code, const std::string& detail) override;

  // FrameSink
  void sendText(const std::string& payload) override;
  void pauseReading(bool paused) override;
  void closeForPolicyViolation(const std::string& reason) override;

  /**
   * Write the response with security headers and Connection: close, then
   * close once it is flushed. Logs the completion line.
   */
  void respond(http::HttpResponse response);

  /**
   * Switch to websocket framing. Writes the 101 and replays any bytes the
   * client sent after its request.
   */
  void upgrade(McpSessionSharedPtr session, const std::string& accept_key);

  // Server shutdown: close frame 1001 for websocket peers, then close
  void shutdown();

  void setMode(Mode mode) { mode_ = mode; }
  Mode mode() const { return mode_; }
  uint64_t id() const { return tcp_->id(); }
  const std::string& peerAddress() const { return tcp_->peerAddress(); }
  const std::string& clientId() const { return client_id_; }
  void setClientId(const std::string& client_id) { client_id_ = client_id; }
  const McpSessionSharedPtr& session() const { return session_; }

 private:
  void handleParsedRequest();
  void closeChannel(uint16_t code,
                    protocol::SessionEvent event,
                    const std::string& reason);

  GatewayServer& server_;
  network::TcpConnectionPtr tcp_;
  http::RequestParser parser_;
  std::unique_ptr<websocket::FrameParser> frame_parser_;
  McpSessionSharedPtr session_;
  Mode mode_{Mode::Http};
  std::string client_id_;

  // For the completion log line
  std::string request_method_;
  std::string request_path_;
  std::chrono::steady_clock::time_point request_start_;
};

using GatewayConnectionPtr = std::unique_ptr<GatewayConnection>;

/**
 * Services the server reads but does not own. All must outlive it.
 */
struct GatewayContext {
  const config::ServerConfig& config;
  event::Dispatcher& dispatcher;
  event::WorkerPool& workers;
  const ToolRegistry& registry;
  auth::OAuthFlow& oauth;
  auth::TokenStore& token_store;
};

class GatewayServer : public network::ListenerCallbacks {
 public:
  explicit GatewayServer(const GatewayContext& context);
  ~GatewayServer() override;

  GatewayServer(const GatewayServer&) = delete;
  GatewayServer& operator=(const GatewayServer&) = delete;

  /**
   * Bind the configured host:port and start accepting.
   * @throws std::runtime_error when the socket cannot be bound
   */
  void start();

  // Stop accepting and close every connection. Idempotent.
  void shutdown();

  uint16_t port() const { return listener_.localPort(); }
  size_t activeConnections() const { return connections_.size(); }
  size_t activeSessions() const;

  const config::ServerConfig& config() const { return context_.config; }

  // network::ListenerCallbacks
  void onAccept(int fd, const std::string& peer_address) override;

  /**
   * Run the boundary pipeline for one parsed request: identity, rate
   * limit, access guard, route. Answers through the connection, possibly
   * later from a worker completion.
   */
  void handleRequest(GatewayConnection& connection,
                     const http::HttpRequest& request);

  // Called by a connection whose socket has closed
  void removeConnection(uint64_t id);

 private:
  http::HttpResponse serviceInfo() const;
  http::HttpResponse listTools() const;
  http::HttpResponse authStatus() const;
  http::HttpResponse startOAuth();
  void handleOAuthCallback(GatewayConnection& connection,
                           const http::HttpRequest& request);
  void finishOAuthCallback(uint64_t connection_id,
                           const auth::TokenExchangeResult& result);
  void handleUpgrade(GatewayConnection& connection,
                     const http::HttpRequest& request);

  void schedulePrune();

  GatewayContext context_;
  auth::AccessGuard guard_;
  filter::SlidingWindowRateLimiter rate_limiter_;
  protocol::EnvelopeCodec codec_;
  network::TcpListener listener_;

  std::map<uint64_t, GatewayConnectionPtr> connections_;
  uint64_t next_connection_id_{1};
  uint64_t next_session_id_{1};
  event::TimerPtr prune_timer_;
  bool shutting_down_{false};

  // Worker completions check this before touching server state
  std::shared_ptr<bool> alive_;
};

}  // namespace server
}  // namespace mcpgate

#endif  // MCPGATE_SERVER_GATEWAY_SERVER_H
