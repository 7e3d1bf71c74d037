#include "mcpgate/types.h"

#include <fmt/format.h>

namespace mcpgate {

nlohmann::json requestIdToJson(const RequestId& id) {
  if (std::holds_alternative<int64_t>(id)) {
    return std::get<int64_t>(id);
  }
  if (std::holds_alternative<double>(id)) {
    return std::get<double>(id);
  }
  if (std::holds_alternative<std::string>(id)) {
    return std::get<std::string>(id);
  }
  return nullptr;
}

std::string requestIdToString(const RequestId& id) {
  if (std::holds_alternative<int64_t>(id)) {
    return std::to_string(std::get<int64_t>(id));
  }
  if (std::holds_alternative<double>(id)) {
    return fmt::format("{}", std::get<double>(id));
  }
  if (std::holds_alternative<std::string>(id)) {
    return std::get<std::string>(id);
  }
  return "null";
}

}  // namespace mcpgate
