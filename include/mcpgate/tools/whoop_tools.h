/**
 * @file whoop_tools.h
 * @brief WHOOP v2 data tools served through the tool registry
 */
#ifndef MCPGATE_TOOLS_WHOOP_TOOLS_H
#define MCPGATE_TOOLS_WHOOP_TOOLS_H

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcpgate/auth/http_client.h"
#include "mcpgate/auth/token_store.h"
#include "mcpgate/config/server_config.h"
#include "mcpgate/event/worker_pool.h"
#include "mcpgate/server/tool_registry.h"

namespace mcpgate {
namespace tools {

struct WhoopEndpoint {
  std::string tool_name;
  std::string path;  // relative to WhoopConfig::api_base_url
  std::string description;
  bool collection;   // accepts start/end/limit
};

constexpr int kDefaultPageLimit = 10;
constexpr int kMaxPageLimit = 25;

// Registration order is the order tools/list reports
const std::vector<WhoopEndpoint>& whoopEndpoints();

/**
 * Request URL for one call. Collection endpoints get start, end and limit
 * query parameters; limit is clamped to 1..25 and defaults to 10.
 * @throws std::invalid_argument when an argument has the wrong type
 */
std::string buildWhoopUrl(const config::WhoopConfig& config,
                          const WhoopEndpoint& endpoint,
                          const nlohmann::json& arguments);

/**
 * Blocking authenticated GET. Returns the provider body pretty-printed.
 * @throws std::runtime_error when no token is stored, the request fails,
 *         the status is not 2xx or the body is not JSON
 */
std::string fetchWhoopJson(auth::HttpClientBase& http,
                           const auth::TokenStore& tokens,
                           const std::string& url,
                           std::chrono::seconds timeout);

/**
 * Register every WHOOP tool as an async tool whose request runs on
 * workers. http, tokens and workers must outlive the registry.
 */
void registerWhoopTools(server::ToolRegistry& registry,
                        event::WorkerPool& workers,
                        auth::HttpClientBase& http,
                        const auth::TokenStore& tokens,
                        const config::WhoopConfig& config);

}  // namespace tools
}  // namespace mcpgate

#endif  // MCPGATE_TOOLS_WHOOP_TOOLS_H
