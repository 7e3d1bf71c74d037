#include "mcpgate/logging/logger_registry.h"

#include <algorithm>
#include <cctype>

namespace mcpgate {
namespace logging {

std::string LogPattern::globToRegex(const std::string& glob) {
  std::string regex;
  for (char c : glob) {
    switch (c) {
      case '*':
        regex += ".*";
        break;
      case '?':
        regex += ".";
        break;
      case '.':
        regex += "\\.";
        break;
      default:
        regex += c;
        break;
    }
  }
  return regex;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  // Loggers pinned by a component level or pattern keep their level
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[static_cast<int>(component)] = level;

  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);

  for (auto& entry : loggers_) {
    if (std::regex_match(entry.first, patterns_.back().pattern)) {
      entry.second->setLevel(level);
    }
  }
}

bool LoggerRegistry::shouldLog(const std::string& logger_name,
                               LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(logger_name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel effective = getEffectiveLevelLocked(logger_name);
  return effective != LogLevel::Off && level >= effective;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  // Latest pattern wins
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }

  size_t dot_pos = name.find('.');
  if (dot_pos != std::string::npos) {
    std::string prefix = name.substr(0, dot_pos);
    for (int i = 0; i < static_cast<int>(Component::Count); ++i) {
      Component comp = static_cast<Component>(i);
      std::string comp_name = componentToString(comp);
      std::string lowered = comp_name;
      std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if (prefix == comp_name || prefix == lowered) {
        auto level_it = component_levels_.find(i);
        if (level_it != component_levels_.end()) {
          return level_it->second;
        }
        break;
      }
    }
  }

  return global_level_;
}

std::string LoggerRegistry::getComponentPath(Component comp,
                                             const std::string& name) {
  return std::string(componentToString(comp)) + "." + name;
}

}  // namespace logging
}  // namespace mcpgate
