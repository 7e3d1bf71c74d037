#define MCPGATE_LOG_COMPONENT "websocket.codec"

#include "mcpgate/websocket/websocket_codec.h"


#include <openssl/evp.h>
#include <openssl/sha.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace websocket {

namespace {

constexpr const char* kHandshakeGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxControlPayload = 125;
constexpr uint16_t kNoStatusReceived = 1005;

bool isKnownOpcode(uint8_t opcode) {
  switch (static_cast<OpCode>(opcode)) {
    case OpCode::Continuation:
    case OpCode::Text:
    case OpCode::Binary:
    case OpCode::Close:
    case OpCode::Ping:
    case OpCode::Pong:
      return true;
  }
  return false;
}

bool isControl(OpCode opcode) {
  return (static_cast<uint8_t>(opcode) & 0x08) != 0;
}

void appendHeader(std::string& frame,
                  uint8_t first_byte,
                  size_t payload_len,
                  bool masked) {
  const uint8_t mask_bit = masked ? 0x80 : 0x00;
  frame.push_back(static_cast<char>(first_byte));
  if (payload_len < 126) {
    frame.push_back(static_cast<char>(mask_bit | payload_len));
  } else if (payload_len < 65536) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((payload_len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(payload_len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      frame.push_back(static_cast<char>(
          (static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF));
    }
  }
}

}  // namespace

std::string computeAcceptKey(const std::string& client_key) {
  std::string input = client_key + kHandshakeGuid;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(),
       digest);

  // 20 bytes -> 28 base64 characters plus terminator
  unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
  int written = EVP_EncodeBlock(encoded, digest, SHA_DIGEST_LENGTH);
  return std::string(reinterpret_cast<char*>(encoded),
                     static_cast<size_t>(written));
}

bool isValidClientKey(const std::string& client_key) {
  if (client_key.size() != 24) {
    return false;
  }
  unsigned char decoded[18];
  int n = EVP_DecodeBlock(decoded,
                          reinterpret_cast<const unsigned char*>(
                              client_key.data()),
                          static_cast<int>(client_key.size()));
  // EVP_DecodeBlock counts the two padding bytes in its result
  return n == 18 && client_key[22] == '=' && client_key[23] == '=';
}

std::string encodeFrame(OpCode opcode, const std::string& payload) {
  std::string frame;
  frame.reserve(payload.size() + 10);
  appendHeader(frame, 0x80 | static_cast<uint8_t>(opcode), payload.size(),
               false);
  frame += payload;
  return frame;
}

std::string encodeMaskedFrame(OpCode opcode,
                              const std::string& payload,
                              const std::array<uint8_t, 4>& mask_key,
                              bool fin) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  uint8_t first = static_cast<uint8_t>(opcode) | (fin ? 0x80 : 0x00);
  appendHeader(frame, first, payload.size(), true);
  for (uint8_t b : mask_key) {
    frame.push_back(static_cast<char>(b));
  }
  for (size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ mask_key[i % 4]));
  }
  return frame;
}

std::string encodeCloseFrame(uint16_t code, const std::string& reason) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  payload += reason.substr(0, kMaxControlPayload - 2);
  return encodeFrame(OpCode::Close, payload);
}

FrameParser::FrameParser(FrameParserCallbacks& callbacks,
                         size_t max_message_bytes)
    : callbacks_(callbacks), max_message_bytes_(max_message_bytes) {}

void FrameParser::feed(const char* data, size_t length) {
  if (stopped_) {
    return;
  }
  buffer_.append(data, length);
  while (!stopped_ && parseOne()) {
  }
}

void FrameParser::fail(uint16_t code, const std::string& detail) {
  MCPGATE_LOG(Warning, "WebSocket protocol error ({}): {}", code, detail);
  stopped_ = true;
  buffer_.clear();
  message_.clear();
  callbacks_.onProtocolError(code, detail);
}

bool FrameParser::parseOne() {
  const auto* bytes = reinterpret_cast<const uint8_t*>(buffer_.data());
  const size_t available = buffer_.size();
  if (available < 2) {
    return false;
  }

  const bool fin = (bytes[0] & 0x80) != 0;
  const uint8_t rsv = bytes[0] & 0x70;
  const uint8_t raw_opcode = bytes[0] & 0x0F;
  const bool masked = (bytes[1] & 0x80) != 0;
  uint64_t payload_len = bytes[1] & 0x7F;
  size_t header_size = 2;

  if (rsv != 0) {
    fail(close_code::PROTOCOL_ERROR, "reserved bits set");
    return false;
  }
  if (!isKnownOpcode(raw_opcode)) {
    fail(close_code::PROTOCOL_ERROR,
         "unknown opcode " + std::to_string(raw_opcode));
    return false;
  }
  if (!masked) {
    fail(close_code::PROTOCOL_ERROR, "client frame is not masked");
    return false;
  }
  const OpCode opcode = static_cast<OpCode>(raw_opcode);

  if (payload_len == 126) {
    if (available < 4) {
      return false;
    }
    payload_len = (static_cast<uint64_t>(bytes[2]) << 8) | bytes[3];
    header_size = 4;
  } else if (payload_len == 127) {
    if (available < 10) {
      return false;
    }
    payload_len = 0;
    for (int i = 2; i < 10; ++i) {
      payload_len = (payload_len << 8) | bytes[i];
    }
    header_size = 10;
    if (payload_len >> 63) {
      fail(close_code::PROTOCOL_ERROR, "payload length has MSB set");
      return false;
    }
  }

  if (isControl(opcode)) {
    if (!fin || payload_len > kMaxControlPayload) {
      fail(close_code::PROTOCOL_ERROR, "invalid control frame");
      return false;
    }
  } else if (payload_len > max_message_bytes_ ||
             message_.size() + payload_len > max_message_bytes_) {
    fail(close_code::MESSAGE_TOO_BIG,
         "message exceeds " + std::to_string(max_message_bytes_) + " bytes");
    return false;
  }

  const size_t mask_offset = header_size;
  header_size += 4;
  const size_t frame_size = header_size + static_cast<size_t>(payload_len);
  if (available < frame_size) {
    return false;
  }

  std::string payload(buffer_, header_size, static_cast<size_t>(payload_len));
  const uint8_t* mask_key = bytes + mask_offset;
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<char>(payload[i] ^ mask_key[i % 4]);
  }
  buffer_.erase(0, frame_size);

  switch (opcode) {
    case OpCode::Text:
    case OpCode::Binary:
      if (in_fragmented_message_) {
        fail(close_code::PROTOCOL_ERROR,
             "new data frame inside a fragmented message");
        return false;
      }
      if (fin) {
        callbacks_.onMessage(payload, opcode == OpCode::Binary);
      } else {
        in_fragmented_message_ = true;
        message_binary_ = opcode == OpCode::Binary;
        message_ = std::move(payload);
      }
      break;

    case OpCode::Continuation:
      if (!in_fragmented_message_) {
        fail(close_code::PROTOCOL_ERROR, "continuation without a message");
        return false;
      }
      message_ += payload;
      if (fin) {
        in_fragmented_message_ = false;
        std::string message = std::move(message_);
        message_.clear();
        callbacks_.onMessage(message, message_binary_);
      }
      break;

    case OpCode::Ping:
      callbacks_.onPing(payload);
      break;

    case OpCode::Pong:
      break;

    case OpCode::Close: {
      if (payload.size() == 1) {
        fail(close_code::PROTOCOL_ERROR, "close frame with 1-byte payload");
        return false;
      }
      uint16_t code = kNoStatusReceived;
      std::string reason;
      if (payload.size() >= 2) {
        code = static_cast<uint16_t>(
            (static_cast<uint8_t>(payload[0]) << 8) |
            static_cast<uint8_t>(payload[1]));
        reason = payload.substr(2);
      }
      stopped_ = true;
      buffer_.clear();
      callbacks_.onClose(code, reason);
      return false;
    }
  }
  return true;
}

}  // namespace websocket
}  // namespace mcpgate
