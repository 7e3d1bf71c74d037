#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgate/logging/logger.h"

namespace mcpgate {
namespace logging {

// Glob pattern ("http.*", "server.session?") mapped to a level
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob);
};

class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  // Replaces the sink of every logger, existing and future
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  void setGlobalLevel(LogLevel level);
  void setComponentLevel(Component component, LogLevel level);
  void setPattern(const std::string& pattern, LogLevel level);

  bool shouldLog(const std::string& logger_name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& name);

  static std::string getComponentPath(Component comp, const std::string& name);

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::unordered_map<int, LogLevel> component_levels_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> default_sink_;
};

// Logger bound to a component, named "<Component>.<name>"
class ComponentLogger {
 public:
  ComponentLogger(Component component, const std::string& name)
      : component_(component),
        logger_(LoggerRegistry::instance().getOrCreateLogger(
            LoggerRegistry::getComponentPath(component, name))) {}

  template <typename... Args>
  void log(LogLevel level, const char* format_str, Args&&... args) {
    if (logger_->shouldLog(level)) {
      LogContext ctx;
      ctx.component = component_;
      logger_->logWithContext(level, ctx, format_str,
                              std::forward<Args>(args)...);
    }
  }

 private:
  Component component_;
  std::shared_ptr<Logger> logger_;
};

}  // namespace logging
}  // namespace mcpgate
