#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "mcpgate/logging/log_level.h"
#include "mcpgate/logging/log_message.h"
#include "mcpgate/logging/log_sink.h"

namespace mcpgate {
namespace logging {

class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name) : name_(name) {}

  template <typename... Args>
  void debug(const char* format_str, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug,
              fmt::format(fmt::runtime(format_str),
                          std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(const char* format_str, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info,
              fmt::format(fmt::runtime(format_str),
                          std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(const char* format_str, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning,
              fmt::format(fmt::runtime(format_str),
                          std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(const char* format_str, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error,
              fmt::format(fmt::runtime(format_str),
                          std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void logWithContext(LogLevel level,
                      const LogContext& ctx,
                      const char* format_str,
                      Args&&... args) {
    if (shouldLog(level)) {
      auto msg = ctx.toLogMessage(
          level, fmt::format(fmt::runtime(format_str),
                             std::forward<Args>(args)...));
      msg.logger_name = name_;
      logMessage(msg);
    }
  }

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* format_str,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt::runtime(format_str),
                                std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  bool shouldLog(LogLevel level) const {
    auto current = effective_level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  const std::string& getName() const { return name_; }

 private:
  void logImpl(LogLevel level, const std::string& text) {
    LogMessage msg;
    msg.level = level;
    msg.message = text;
    msg.logger_name = name_;
    logMessage(msg);
  }

  void logMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  std::atomic<LogLevel> effective_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  std::string name_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace mcpgate
