#pragma once

#include <cstdint>
#include <string>

namespace mcpgate {
namespace logging {

// RFC-5424 severities
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Component identifiers for hierarchical logging
enum class Component {
  Root,
  Server,
  Network,
  Http,
  WebSocket,
  Protocol,
  Auth,
  RateLimit,
  Tool,
  Config,
  Event,
  Count
};

enum class SinkType { File, Stdio, Null, External };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
  }
  return "UNKNOWN";
}

// Unknown names map to Info
inline LogLevel stringToLogLevel(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return LogLevel::Debug;
  if (str == "INFO" || str == "info") return LogLevel::Info;
  if (str == "NOTICE" || str == "notice") return LogLevel::Notice;
  if (str == "WARNING" || str == "warning") return LogLevel::Warning;
  if (str == "ERROR" || str == "error") return LogLevel::Error;
  if (str == "CRITICAL" || str == "critical") return LogLevel::Critical;
  if (str == "ALERT" || str == "alert") return LogLevel::Alert;
  if (str == "EMERGENCY" || str == "emergency") return LogLevel::Emergency;
  if (str == "OFF" || str == "off") return LogLevel::Off;
  return LogLevel::Info;
}

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "Root";
    case Component::Server: return "Server";
    case Component::Network: return "Network";
    case Component::Http: return "Http";
    case Component::WebSocket: return "WebSocket";
    case Component::Protocol: return "Protocol";
    case Component::Auth: return "Auth";
    case Component::RateLimit: return "RateLimit";
    case Component::Tool: return "Tool";
    case Component::Config: return "Config";
    case Component::Event: return "Event";
    case Component::Count: break;
  }
  return "Unknown";
}

}  // namespace logging
}  // namespace mcpgate
