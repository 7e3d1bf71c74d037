#ifndef MCPGATE_TYPES_H
#define MCPGATE_TYPES_H

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcpgate {

// JSON-RPC request id: string, number or null, echoed back unmodified
using RequestId = std::variant<std::nullptr_t, int64_t, double, std::string>;

nlohmann::json requestIdToJson(const RequestId& id);

// Human-readable id for log correlation ("null", "7", "abc")
std::string requestIdToString(const RequestId& id);

// JSON-RPC error codes, fixed for interoperability
namespace jsonrpc {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
}  // namespace jsonrpc

// Protocol identity reported by "initialize"
namespace protocol_info {
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* SERVER_NAME = "whoop-mcp";
constexpr const char* SERVER_VERSION = "2.0.0";
}  // namespace protocol_info

struct Error {
  int code{0};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

}  // namespace mcpgate

#endif  // MCPGATE_TYPES_H
