#ifndef MCPGATE_PROTOCOL_ENVELOPE_H
#define MCPGATE_PROTOCOL_ENVELOPE_H

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "mcpgate/types.h"

namespace mcpgate {
namespace protocol {

// Validated inbound request. params is always an object.
struct RequestEnvelope {
  RequestId id{nullptr};
  std::string method;
  nlohmann::json params = nlohmann::json::object();
};

struct ErrorObject {
  int code{0};
  std::string message;
};

// Exactly one of result/error, enforced by the variant
struct ResponseEnvelope {
  RequestId id{nullptr};
  std::variant<nlohmann::json, ErrorObject> body;

  static ResponseEnvelope success(const RequestId& id, nlohmann::json result) {
    return ResponseEnvelope{id, std::move(result)};
  }

  static ResponseEnvelope failure(const RequestId& id,
                                  int code,
                                  const std::string& message) {
    return ResponseEnvelope{id, ErrorObject{code, message}};
  }

  bool isError() const { return std::holds_alternative<ErrorObject>(body); }
};

enum class DecodeErrorKind {
  OversizedMessage,
  MalformedSyntax,
  InvalidShape
};

const char* decodeErrorKindName(DecodeErrorKind kind);

struct DecodeFailure {
  DecodeErrorKind kind;
  // Best-effort id recovered from the frame, null when unavailable
  RequestId id{nullptr};
  // Internal detail for logs; never sent to the peer
  std::string detail;
};

using DecodeResult = std::variant<RequestEnvelope, DecodeFailure>;

}  // namespace protocol
}  // namespace mcpgate

#endif  // MCPGATE_PROTOCOL_ENVELOPE_H
