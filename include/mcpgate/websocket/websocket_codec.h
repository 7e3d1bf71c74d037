#ifndef MCPGATE_WEBSOCKET_WEBSOCKET_CODEC_H
#define MCPGATE_WEBSOCKET_WEBSOCKET_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @file websocket_codec.h
 * @brief RFC 6455 handshake helpers and an incremental frame parser
 */

namespace mcpgate {
namespace websocket {

enum class OpCode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

namespace close_code {
constexpr uint16_t NORMAL = 1000;
constexpr uint16_t GOING_AWAY = 1001;
constexpr uint16_t PROTOCOL_ERROR = 1002;
constexpr uint16_t POLICY_VIOLATION = 1008;
constexpr uint16_t MESSAGE_TOO_BIG = 1009;
constexpr uint16_t INTERNAL_ERROR = 1011;
}  // namespace close_code

constexpr const char* kWebSocketVersion = "13";

// base64(SHA-1(client_key + GUID))
std::string computeAcceptKey(const std::string& client_key);

// A Sec-WebSocket-Key must decode to exactly 16 bytes
bool isValidClientKey(const std::string& client_key);

// Single FIN frame, unmasked (server to client)
std::string encodeFrame(OpCode opcode, const std::string& payload);

// Single frame masked with mask_key (client to server)
std::string encodeMaskedFrame(OpCode opcode,
                              const std::string& payload,
                              const std::array<uint8_t, 4>& mask_key,
                              bool fin = true);

std::string encodeCloseFrame(uint16_t code, const std::string& reason = "");

class FrameParserCallbacks {
 public:
  virtual ~FrameParserCallbacks() = default;

  // A complete data message, continuation fragments already joined
  virtual void onMessage(const std::string& payload, bool binary) = 0;

  virtual void onPing(const std::string& payload) = 0;

  // Peer sent close; code is 1005 when the frame carried no status
  virtual void onClose(uint16_t code, const std::string& reason) = 0;

  // Framing violation; the channel must be closed with close_code
  virtual void onProtocolError(uint16_t close_code,
                               const std::string& detail) = 0;
};

/**
 * Incremental parser for client-to-server frames. Partial frames are
 * buffered across feed() calls. After a close frame or a protocol error
 * the parser stops and ignores further input.
 */
class FrameParser {
 public:
  FrameParser(FrameParserCallbacks& callbacks, size_t max_message_bytes);

  void feed(const char* data, size_t length);

  bool stopped() const { return stopped_; }
  size_t bufferedBytes() const { return buffer_.size(); }

 private:
  // Returns false when more bytes are needed or the parser stopped
  bool parseOne();
  void fail(uint16_t code, const std::string& detail);

  FrameParserCallbacks& callbacks_;
  size_t max_message_bytes_;
  std::string buffer_;
  std::string message_;
  bool message_binary_{false};
  bool in_fragmented_message_{false};
  bool stopped_{false};
};

}  // namespace websocket
}  // namespace mcpgate

#endif  // MCPGATE_WEBSOCKET_WEBSOCKET_CODEC_H
