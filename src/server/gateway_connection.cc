#define MCPGATE_LOG_COMPONENT "server.connection"

#include "mcpgate/logging/log_macros.h"
#include "mcpgate/server/gateway_server.h"

namespace mcpgate {
namespace server {

namespace {

// Codes a peer may legitimately receive back in a close frame
uint16_t closeReplyCode(uint16_t received) {
  if (received < 1000 || received == 1005 || received == 1006 ||
      received == 1015 || received >= 5000) {
    return websocket::close_code::NORMAL;
  }
  return received;
}

}  // namespace

GatewayConnection::GatewayConnection(GatewayServer& server,
                                     network::TcpConnectionPtr tcp)
    : server_(server),
      tcp_(std::move(tcp)),
      request_start_(std::chrono::steady_clock::now()) {
  tcp_->setCallbacks(*this);
}

GatewayConnection::~GatewayConnection() {
  if (session_) {
    session_->close(protocol::SessionEvent::ShutdownRequested,
                    "connection destroyed");
  }
}

void GatewayConnection::onData(const char* data, size_t length) {
  switch (mode_) {
    case Mode::Http: {
      auto status = parser_.feed(data, length);
      if (status == http::ParseStatus::NeedMore) {
        return;
      }
      if (status == http::ParseStatus::Error) {
        request_method_ = parser_.request().method;
        request_path_ = parser_.request().path;
        MCPGATE_LOG(Warning, "Rejected request from {}: {}", peerAddress(),
                    parser_.errorReason());
        int code = parser_.errorStatus();
        respond(http::HttpResponse::json(
            code, {{"error", http::statusReason(code)}}));
        return;
      }
      handleParsedRequest();
      return;
    }
    case Mode::WebSocket:
      frame_parser_->feed(data, length);
      return;
    case Mode::AwaitingWorker:
    case Mode::Done:
      // One request per plain HTTP connection
      return;
  }
}

void GatewayConnection::onEvent(network::ConnectionEvent event) {
  if (session_) {
    if (event == network::ConnectionEvent::RemoteClose) {
      session_->close(protocol::SessionEvent::PeerClosed,
                      "connection closed by peer");
    } else {
      session_->close(protocol::SessionEvent::TransportFault,
                      "connection closed locally");
    }
  }
  mode_ = Mode::Done;
  server_.removeConnection(id());
}

void GatewayConnection::handleParsedRequest() {
  const auto& request = parser_.request();
  request_method_ = request.method;
  request_path_ = request.path;
  request_start_ = std::chrono::steady_clock::now();
  server_.handleRequest(*this, request);
}

void GatewayConnection::respond(http::HttpResponse response) {
  if (mode_ == Mode::Done || mode_ == Mode::WebSocket || !tcp_->isOpen()) {
    return;
  }
  http::addSecurityHeaders(response);
  response.setHeader("Connection", "close");

  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - request_start_;
  MCPGATE_LOG(Info, "{} {} -> {} ({:.3f}s)", request_method_, request_path_,
              response.status, elapsed.count());

  mode_ = Mode::Done;
  tcp_->write(response.serialize());
  tcp_->close(network::ConnectionCloseType::FlushWrite);
}

void GatewayConnection::upgrade(McpSessionSharedPtr session,
                                const std::string& accept_key) {
  http::HttpResponse response;
  response.status = 101;
  response.setHeader("Upgrade", "websocket");
  response.setHeader("Connection", "Upgrade");
  response.setHeader("Sec-WebSocket-Accept", accept_key);
  http::addSecurityHeaders(response);

  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - request_start_;
  MCPGATE_LOG(Info, "{} {} -> 101 ({:.3f}s)", request_method_, request_path_,
              elapsed.count());

  session_ = std::move(session);
  frame_parser_ = std::make_unique<websocket::FrameParser>(
      *this, server_.config().max_frame_bytes);
  mode_ = Mode::WebSocket;
  tcp_->write(response.serialize());

  std::string early = parser_.takeTrailingBytes();
  if (!early.empty() && tcp_->isOpen()) {
    frame_parser_->feed(early.data(), early.size());
  }
}

void GatewayConnection::onMessage(const std::string& payload, bool binary) {
  if (binary) {
    MCPGATE_LOG(Debug, "Binary message on {} treated as text", id());
  }
  if (session_) {
    session_->onFrame(payload);
  }
}

void GatewayConnection::onPing(const std::string& payload) {
  if (tcp_->isOpen()) {
    tcp_->write(websocket::encodeFrame(websocket::OpCode::Pong, payload));
  }
}

void GatewayConnection::onClose(uint16_t code, const std::string& reason) {
  MCPGATE_LOG(Debug, "Close frame {} from {}: {}", code, peerAddress(),
              reason);
  closeChannel(closeReplyCode(code), protocol::SessionEvent::PeerClosed,
               "websocket close");
}

void GatewayConnection::onProtocolError(uint16_t close_code,
                                        const std::string& detail) {
  MCPGATE_LOG(Warning, "WebSocket error from {}: {}", peerAddress(), detail);
  closeChannel(close_code, protocol::SessionEvent::TransportFault, detail);
}

void GatewayConnection::sendText(const std::string& payload) {
  if (mode_ != Mode::WebSocket || !tcp_->isOpen()) {
    return;
  }
  tcp_->write(websocket::encodeFrame(websocket::OpCode::Text, payload));
}

void GatewayConnection::pauseReading(bool paused) {
  if (mode_ != Mode::WebSocket || tcp_->isClosed()) {
    return;
  }
  tcp_->readDisable(paused);
}

void GatewayConnection::closeForPolicyViolation(const std::string& reason) {
  if (mode_ != Mode::WebSocket) {
    return;
  }
  closeChannel(websocket::close_code::POLICY_VIOLATION,
               protocol::SessionEvent::TransportFault, reason);
}

void GatewayConnection::closeChannel(uint16_t code,
                                     protocol::SessionEvent event,
                                     const std::string& reason) {
  if (tcp_->isOpen()) {
    tcp_->write(websocket::encodeCloseFrame(code));
  }
  if (session_) {
    session_->close(event, reason);
  }
  mode_ = Mode::Done;
  tcp_->close(network::ConnectionCloseType::FlushWrite);
}

void GatewayConnection::shutdown() {
  if (mode_ == Mode::WebSocket) {
    closeChannel(websocket::close_code::GOING_AWAY,
                 protocol::SessionEvent::ShutdownRequested,
                 "server shutting down");
    return;
  }
  mode_ = Mode::Done;
  tcp_->close(network::ConnectionCloseType::NoFlush);
}

}  // namespace server
}  // namespace mcpgate
