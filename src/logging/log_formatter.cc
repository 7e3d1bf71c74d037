#include "mcpgate/logging/log_formatter.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace mcpgate {
namespace logging {

static std::string formatTimestamp(
    const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::ostringstream oss;

  oss << '[' << formatTimestamp(msg.timestamp) << "] ";
  oss << '[' << logLevelToString(msg.level) << "] ";
  oss << "[T:" << msg.thread_id << "] ";

  if (msg.component != Component::Root) {
    oss << '[' << componentToString(msg.component);
    if (!msg.component_name.empty()) {
      oss << '.' << msg.component_name;
    }
    oss << "] ";
  }

  oss << '[' << msg.logger_name << "] ";

  if (!msg.connection_id.empty()) {
    oss << "[conn:" << msg.connection_id << "] ";
  }
  if (!msg.client_id.empty()) {
    oss << "[client:" << msg.client_id << "] ";
  }
  if (!msg.request_id.empty()) {
    oss << "[req:" << msg.request_id << "] ";
  }

  oss << msg.message;

  if (!msg.key_values.empty()) {
    oss << " {";
    bool first = true;
    for (const auto& kv : msg.key_values) {
      if (!first)
        oss << ", ";
      oss << kv.first << "=" << kv.second;
      first = false;
    }
    oss << "}";
  }

  return oss.str();
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json j;
  j["timestamp"] = formatTimestamp(msg.timestamp);
  j["level"] = logLevelToString(msg.level);
  j["logger"] = msg.logger_name;

  std::ostringstream thread;
  thread << msg.thread_id;
  j["thread"] = thread.str();
  if (msg.process_id > 0) {
    j["pid"] = msg.process_id;
  }

  if (msg.component != Component::Root) {
    j["component"] = componentToString(msg.component);
  }
  if (msg.file) {
    j["file"] = msg.file;
    j["line"] = msg.line;
    if (msg.function) {
      j["function"] = msg.function;
    }
  }

  if (!msg.connection_id.empty())
    j["connection_id"] = msg.connection_id;
  if (!msg.session_id.empty())
    j["session_id"] = msg.session_id;
  if (!msg.request_id.empty())
    j["request_id"] = msg.request_id;
  if (!msg.client_id.empty())
    j["client_id"] = msg.client_id;
  if (!msg.mcp_method.empty())
    j["mcp_method"] = msg.mcp_method;
  if (!msg.mcp_tool.empty())
    j["mcp_tool"] = msg.mcp_tool;

  j["message"] = msg.message;

  if (!msg.key_values.empty()) {
    j["metadata"] = msg.key_values;
  }

  // Replace invalid UTF-8 rather than throwing from inside a log call
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace mcpgate
