#pragma once

#include <string>

#include "mcpgate/logging/log_message.h"

namespace mcpgate {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [time] [LEVEL] [T:thread] [Component] [logger] message {k=v}
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line, for log shippers
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace mcpgate
