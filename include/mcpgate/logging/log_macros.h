#pragma once

#include "mcpgate/logging/logger_registry.h"

// Translation units define MCPGATE_LOG_COMPONENT before including this
// header, e.g. #define MCPGATE_LOG_COMPONENT "server.session"
#ifndef MCPGATE_LOG_COMPONENT
#define MCPGATE_LOG_COMPONENT "default"
#endif

#ifdef MCPGATE_LOG_DISABLE
#define MCPGATE_LOG(level, ...) ((void)0)
#define MCPGATE_LOG_WITH_CONTEXT(level, context, ...) ((void)0)
#else
#define MCPGATE_LOG(level, ...)                                           \
  do {                                                                    \
    auto mcpgate_logger_ =                                                \
        ::mcpgate::logging::LoggerRegistry::instance().getOrCreateLogger( \
            MCPGATE_LOG_COMPONENT);                                       \
    if (mcpgate_logger_->shouldLog(::mcpgate::logging::LogLevel::level)) { \
      mcpgate_logger_->log(::mcpgate::logging::LogLevel::level, __FILE__, \
                           __LINE__, __FUNCTION__, __VA_ARGS__);          \
    }                                                                     \
  } while (0)

#define MCPGATE_LOG_WITH_CONTEXT(level, context, ...)                     \
  do {                                                                    \
    auto mcpgate_logger_ =                                                \
        ::mcpgate::logging::LoggerRegistry::instance().getOrCreateLogger( \
            MCPGATE_LOG_COMPONENT);                                       \
    if (mcpgate_logger_->shouldLog(::mcpgate::logging::LogLevel::level)) { \
      ::mcpgate::logging::LogContext mcpgate_ctx_ = (context);            \
      mcpgate_ctx_.setLocation(__FILE__, __LINE__, __FUNCTION__);         \
      mcpgate_logger_->logWithContext(::mcpgate::logging::LogLevel::level, \
                                      mcpgate_ctx_, __VA_ARGS__);         \
    }                                                                     \
  } while (0)
#endif

#define COMPONENT_LOG(component, level, ...)                  \
  ::mcpgate::logging::ComponentLogger(                        \
      ::mcpgate::logging::Component::component, #component)   \
      .log(::mcpgate::logging::LogLevel::level, __VA_ARGS__)
