/**
 * @file tool_registry.h
 * @brief Name to handler table populated once at start-up
 */
#ifndef MCPGATE_SERVER_TOOL_REGISTRY_H
#define MCPGATE_SERVER_TOOL_REGISTRY_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcpgate {
namespace server {

struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema = defaultInputSchema();

  static nlohmann::json defaultInputSchema() {
    return {{"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", nlohmann::json::array()}};
  }
};

struct ToolSuccess {
  nlohmann::json value;
};

struct ToolNotFound {
  std::string name;
};

// cause is for server-side logs only
struct ToolError {
  std::string name;
  std::string cause;
};

using ToolOutcome = std::variant<ToolSuccess, ToolNotFound, ToolError>;

/**
 * Completion handle given to async tools. Exactly one of succeed() or
 * fail() takes effect; later calls are ignored. May be called from any
 * thread.
 */
class ToolResponder {
 public:
  using Completion = std::function<void(ToolOutcome)>;

  ToolResponder(std::string name, Completion completion);

  void succeed(nlohmann::json value) const;
  void fail(const std::string& cause) const;

 private:
  struct State {
    std::string name;
    Completion completion;
    std::atomic<bool> done{false};
  };

  std::shared_ptr<State> state_;
};

class ToolRegistry {
 public:
  using SyncHandler = std::function<nlohmann::json(const nlohmann::json&)>;
  using AsyncHandler =
      std::function<void(const nlohmann::json&, const ToolResponder&)>;
  using Completion = ToolResponder::Completion;

  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  /**
   * Register a tool that computes its result on the calling thread.
   * @throws std::logic_error after seal()
   * @throws std::invalid_argument for an empty or duplicate name
   */
  void registerTool(const ToolDescriptor& tool, SyncHandler handler);

  // Register a tool that completes later through its ToolResponder
  void registerAsyncTool(const ToolDescriptor& tool, AsyncHandler handler);

  // Freeze the table; lookups are lock-free from here on
  void seal() { sealed_.store(true, std::memory_order_release); }
  bool sealed() const { return sealed_.load(std::memory_order_acquire); }

  std::vector<ToolDescriptor> list() const;
  bool hasTool(const std::string& name) const;
  size_t size() const { return order_.size(); }

  /**
   * Invoke a tool by exact name. completion runs exactly once: inline for
   * unknown names and sync tools, on whatever thread the tool finishes on
   * for async tools. Handler exceptions become ToolError.
   */
  void invoke(const std::string& name,
              const nlohmann::json& arguments,
              Completion completion) const;

 private:
  struct Entry {
    ToolDescriptor descriptor;
    SyncHandler sync_handler;
    AsyncHandler async_handler;
  };

  void addEntry(Entry entry);

  std::vector<std::string> order_;
  std::unordered_map<std::string, Entry> tools_;
  std::atomic<bool> sealed_{false};
};

}  // namespace server
}  // namespace mcpgate

#endif  // MCPGATE_SERVER_TOOL_REGISTRY_H
