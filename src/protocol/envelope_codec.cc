#define MCPGATE_LOG_COMPONENT "protocol.codec"

#include "mcpgate/protocol/envelope_codec.h"

#include <limits>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace protocol {

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

// Returns false when the value cannot serve as a JSON-RPC id
bool extractId(const nlohmann::json& value, RequestId& out) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
      out = nullptr;
      return true;
    case nlohmann::json::value_t::string:
      out = value.get<std::string>();
      return true;
    case nlohmann::json::value_t::number_integer:
      out = value.get<int64_t>();
      return true;
    case nlohmann::json::value_t::number_unsigned: {
      auto u = value.get<uint64_t>();
      if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        out = static_cast<int64_t>(u);
      } else {
        out = static_cast<double>(u);
      }
      return true;
    }
    case nlohmann::json::value_t::number_float:
      out = value.get<double>();
      return true;
    default:
      return false;
  }
}

DecodeFailure invalidShape(const RequestId& id, const std::string& detail) {
  return DecodeFailure{DecodeErrorKind::InvalidShape, id, detail};
}

}  // namespace

const char* decodeErrorKindName(DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::OversizedMessage:
      return "OversizedMessage";
    case DecodeErrorKind::MalformedSyntax:
      return "MalformedSyntax";
    case DecodeErrorKind::InvalidShape:
      return "InvalidShape";
  }
  return "Unknown";
}

std::string boundMethodName(const std::string& method, size_t max_chars) {
  auto first = method.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return std::string();
  }
  auto last = method.find_last_not_of(kWhitespace);
  std::string trimmed = method.substr(first, last - first + 1);

  // Count UTF-8 lead bytes so a multi-byte character is never split
  size_t chars = 0;
  for (size_t i = 0; i < trimmed.size(); ++i) {
    auto c = static_cast<unsigned char>(trimmed[i]);
    if ((c & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return trimmed.substr(0, i);
      }
      ++chars;
    }
  }
  return trimmed;
}

DecodeResult EnvelopeCodec::decode(const std::string& frame) const {
  if (frame.size() > limits_.max_message_bytes) {
    MCPGATE_LOG(Debug, "Rejecting oversized message: {} bytes (limit {})",
                frame.size(), limits_.max_message_bytes);
    return DecodeFailure{DecodeErrorKind::OversizedMessage, nullptr,
                         "message exceeds " +
                             std::to_string(limits_.max_message_bytes) +
                             " bytes"};
  }

  auto doc = nlohmann::json::parse(frame, nullptr, false);
  if (doc.is_discarded()) {
    return DecodeFailure{DecodeErrorKind::MalformedSyntax, nullptr,
                         "invalid JSON"};
  }

  if (!doc.is_object()) {
    return invalidShape(nullptr, "top-level value is not an object");
  }

  RequestEnvelope request;
  auto id_it = doc.find("id");
  if (id_it != doc.end() && !extractId(*id_it, request.id)) {
    return invalidShape(nullptr, "id must be a string, number or null");
  }

  auto version_it = doc.find("jsonrpc");
  if (version_it != doc.end() &&
      (!version_it->is_string() || version_it->get<std::string>() != "2.0")) {
    return invalidShape(request.id, "jsonrpc must be \"2.0\"");
  }

  auto method_it = doc.find("method");
  if (method_it == doc.end()) {
    return invalidShape(request.id, "method missing");
  }
  std::string method;
  if (method_it->is_string()) {
    method = method_it->get<std::string>();
  } else if (method_it->is_number() || method_it->is_boolean()) {
    // Scalars are coerced to their text and routed like any unknown method
    method = method_it->dump();
  } else {
    return invalidShape(request.id, "method must be a string or scalar");
  }
  request.method = boundMethodName(method, limits_.max_method_length);

  auto params_it = doc.find("params");
  if (params_it != doc.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      return invalidShape(request.id, "params must be an object");
    }
    request.params = std::move(*params_it);
  }

  return request;
}

std::string EnvelopeCodec::encode(const ResponseEnvelope& response) const {
  const auto replace = nlohmann::json::error_handler_t::replace;
  std::string out = "{\"jsonrpc\":\"2.0\",\"id\":";
  out += requestIdToJson(response.id).dump(-1, ' ', false, replace);
  if (response.isError()) {
    const auto& error = std::get<ErrorObject>(response.body);
    nlohmann::json error_json = {{"code", error.code},
                                 {"message", error.message}};
    out += ",\"error\":";
    out += error_json.dump(-1, ' ', false, replace);
  } else {
    out += ",\"result\":";
    out += std::get<nlohmann::json>(response.body)
               .dump(-1, ' ', false, replace);
  }
  out += "}";
  return out;
}

}  // namespace protocol
}  // namespace mcpgate
