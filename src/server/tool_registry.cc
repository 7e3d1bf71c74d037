#define MCPGATE_LOG_COMPONENT "server.tools"

#include "mcpgate/server/tool_registry.h"

#include <stdexcept>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace server {

ToolResponder::ToolResponder(std::string name, Completion completion)
    : state_(std::make_shared<State>()) {
  state_->name = std::move(name);
  state_->completion = std::move(completion);
}

void ToolResponder::succeed(nlohmann::json value) const {
  if (state_->done.exchange(true)) {
    MCPGATE_LOG(Warning, "Tool {} completed more than once", state_->name);
    return;
  }
  state_->completion(ToolSuccess{std::move(value)});
}

void ToolResponder::fail(const std::string& cause) const {
  if (state_->done.exchange(true)) {
    MCPGATE_LOG(Warning, "Tool {} failed after completing: {}", state_->name,
                cause);
    return;
  }
  MCPGATE_LOG(Error, "Tool execution error for {}: {}", state_->name, cause);
  state_->completion(ToolError{state_->name, cause});
}

void ToolRegistry::registerTool(const ToolDescriptor& tool,
                                SyncHandler handler) {
  if (!handler) {
    throw std::invalid_argument("tool " + tool.name + " has no handler");
  }
  addEntry(Entry{tool, std::move(handler), nullptr});
}

void ToolRegistry::registerAsyncTool(const ToolDescriptor& tool,
                                     AsyncHandler handler) {
  if (!handler) {
    throw std::invalid_argument("tool " + tool.name + " has no handler");
  }
  addEntry(Entry{tool, nullptr, std::move(handler)});
}

void ToolRegistry::addEntry(Entry entry) {
  if (sealed()) {
    throw std::logic_error("tool registry is sealed; cannot register " +
                           entry.descriptor.name);
  }
  const std::string name = entry.descriptor.name;
  if (name.empty()) {
    throw std::invalid_argument("tool name must not be empty");
  }
  if (tools_.count(name) != 0) {
    throw std::invalid_argument("tool already registered: " + name);
  }
  if (!entry.descriptor.input_schema.is_object()) {
    entry.descriptor.input_schema = ToolDescriptor::defaultInputSchema();
  }
  order_.push_back(name);
  tools_.emplace(name, std::move(entry));
  MCPGATE_LOG(Debug, "Registered tool {}", name);
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
  std::vector<ToolDescriptor> result;
  result.reserve(order_.size());
  for (const auto& name : order_) {
    result.push_back(tools_.at(name).descriptor);
  }
  return result;
}

bool ToolRegistry::hasTool(const std::string& name) const {
  return tools_.count(name) != 0;
}

void ToolRegistry::invoke(const std::string& name,
                          const nlohmann::json& arguments,
                          Completion completion) const {
  auto it = tools_.find(name);
  if (it == tools_.end()) {
    MCPGATE_LOG(Info, "Tool not found: {}", name);
    completion(ToolNotFound{name});
    return;
  }

  const Entry& entry = it->second;
  ToolResponder responder(name, std::move(completion));

  if (entry.sync_handler) {
    nlohmann::json value;
    try {
      value = entry.sync_handler(arguments);
    } catch (const std::exception& e) {
      responder.fail(e.what());
      return;
    }
    responder.succeed(std::move(value));
    return;
  }

  try {
    entry.async_handler(arguments, responder);
  } catch (const std::exception& e) {
    // A handler that throws before scheduling its work never completes
    responder.fail(e.what());
  }
}

}  // namespace server
}  // namespace mcpgate
