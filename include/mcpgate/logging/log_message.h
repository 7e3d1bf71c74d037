#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "mcpgate/logging/log_level.h"

namespace mcpgate {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  Component component{Component::Root};
  std::string component_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Correlation
  std::string connection_id;
  std::string session_id;
  std::string request_id;
  std::string client_id;

  // Gateway-specific fields
  std::string mcp_method;
  std::string mcp_tool;

  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

// Context carried by a connection or session so every line it logs can be
// correlated without repeating the identifiers at each call site.
class LogContext {
 public:
  std::string connection_id;
  std::string session_id;
  std::string request_id;
  std::string client_id;
  std::string mcp_method;
  std::string mcp_tool;

  Component component{Component::Root};
  std::string component_name;

  std::map<std::string, std::string> metadata;

  void setLocation(const char* file, int line, const char* func) {
    source_file_ = file;
    source_line_ = line;
    source_function_ = func;
  }

  LogMessage toLogMessage(LogLevel level, const std::string& msg) const {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.component = component;
    log_msg.component_name = component_name;
    log_msg.file = source_file_;
    log_msg.line = source_line_;
    log_msg.function = source_function_;
    log_msg.connection_id = connection_id;
    log_msg.session_id = session_id;
    log_msg.request_id = request_id;
    log_msg.client_id = client_id;
    log_msg.mcp_method = mcp_method;
    log_msg.mcp_tool = mcp_tool;
    log_msg.key_values = metadata;
    return log_msg;
  }

 private:
  const char* source_file_{nullptr};
  int source_line_{0};
  const char* source_function_{nullptr};
};

}  // namespace logging
}  // namespace mcpgate
