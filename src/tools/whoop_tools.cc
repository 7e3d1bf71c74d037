#define MCPGATE_LOG_COMPONENT "tools.whoop"

#include "mcpgate/tools/whoop_tools.h"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace tools {

using nlohmann::json;

namespace {

json collectionSchema() {
  return {{"type", "object"},
          {"properties",
           {{"start",
             {{"type", "string"},
              {"description", "ISO-8601 start of the range (inclusive)"}}},
            {"end",
             {{"type", "string"},
              {"description", "ISO-8601 end of the range (exclusive)"}}},
            {"limit",
             {{"type", "integer"},
              {"minimum", 1},
              {"maximum", kMaxPageLimit},
              {"default", kDefaultPageLimit}}}}},
          {"required", json::array()}};
}

std::string optionalString(const json& arguments, const char* key) {
  auto it = arguments.find(key);
  if (it == arguments.end() || it->is_null()) {
    return "";
  }
  if (!it->is_string()) {
    throw std::invalid_argument(fmt::format("'{}' must be a string", key));
  }
  return it->get<std::string>();
}

int pageLimit(const json& arguments) {
  auto it = arguments.find("limit");
  if (it == arguments.end() || it->is_null()) {
    return kDefaultPageLimit;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument("'limit' must be an integer");
  }
  auto limit = it->get<int64_t>();
  return static_cast<int>(
      std::clamp<int64_t>(limit, 1, static_cast<int64_t>(kMaxPageLimit)));
}

}  // namespace

const std::vector<WhoopEndpoint>& whoopEndpoints() {
  static const std::vector<WhoopEndpoint> endpoints = {
      {"get_profile_data", "/user/profile/basic",
       "Get the user's basic WHOOP profile (name and email)", false},
      {"get_body_measurement_data", "/user/measurement/body",
       "Get the user's body measurements (height, weight, max heart rate)",
       false},
      {"get_cycle_data", "/cycle",
       "Get physiological cycles (day strain, kilojoules, heart rate)", true},
      {"get_recovery_data", "/recovery",
       "Get recovery scores, resting heart rate and HRV", true},
      {"get_sleep_data", "/activity/sleep",
       "Get sleep activities with stage durations and performance", true},
      {"get_workout_data", "/activity/workout",
       "Get workouts with strain, heart rate zones and distance", true},
  };
  return endpoints;
}

std::string buildWhoopUrl(const config::WhoopConfig& config,
                          const WhoopEndpoint& endpoint,
                          const json& arguments) {
  std::string url = config.api_base_url + endpoint.path;
  if (!endpoint.collection) {
    return url;
  }

  std::string query = "limit=" + std::to_string(pageLimit(arguments));
  std::string start = optionalString(arguments, "start");
  if (!start.empty()) {
    query += "&start=" + auth::urlEncode(start);
  }
  std::string end = optionalString(arguments, "end");
  if (!end.empty()) {
    query += "&end=" + auth::urlEncode(end);
  }
  return url + "?" + query;
}

std::string fetchWhoopJson(auth::HttpClientBase& http,
                           const auth::TokenStore& tokens,
                           const std::string& url,
                           std::chrono::seconds timeout) {
  auto token = tokens.accessToken();
  if (!token) {
    throw std::runtime_error(
        "no WHOOP access token stored; authenticate via /whoop/auth");
  }

  auth::HttpRequest request;
  request.url = url;
  request.method = auth::HttpMethod::GET;
  request.timeout = timeout;
  request.headers["Authorization"] = "Bearer " + *token;
  request.headers["Accept"] = "application/json";

  auto response = http.request(request);
  if (response.transportFailed()) {
    throw std::runtime_error("WHOOP request failed: " + response.error);
  }
  if (!response.ok()) {
    throw std::runtime_error(
        fmt::format("WHOOP API returned {}: {}", response.status_code,
                    response.body.substr(0, 200)));
  }

  auto body = json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw std::runtime_error("WHOOP API returned a non-JSON body");
  }
  return body.dump(2);
}

void registerWhoopTools(server::ToolRegistry& registry,
                        event::WorkerPool& workers,
                        auth::HttpClientBase& http,
                        const auth::TokenStore& tokens,
                        const config::WhoopConfig& config) {
  for (const auto& endpoint : whoopEndpoints()) {
    server::ToolDescriptor descriptor;
    descriptor.name = endpoint.tool_name;
    descriptor.description = endpoint.description;
    if (endpoint.collection) {
      descriptor.input_schema = collectionSchema();
    }

    registry.registerAsyncTool(
        descriptor,
        [&workers, &http, &tokens, config, endpoint](
            const json& arguments, const server::ToolResponder& responder) {
          // Argument errors surface here and become ToolError
          std::string url = buildWhoopUrl(config, endpoint, arguments);
          auto timeout = config.request_timeout;

          bool queued = workers.submit([&http, &tokens, url, timeout,
                                        responder]() {
            try {
              responder.succeed(fetchWhoopJson(http, tokens, url, timeout));
            } catch (const std::exception& e) {
              responder.fail(e.what());
            }
          });
          if (!queued) {
            responder.fail("worker pool is shut down");
          }
        });
  }
  MCPGATE_LOG(Info, "Registered {} WHOOP tools", whoopEndpoints().size());
}

}  // namespace tools
}  // namespace mcpgate
