#ifndef MCPGATE_AUTH_OAUTH_FLOW_H
#define MCPGATE_AUTH_OAUTH_FLOW_H

#include <chrono>
#include <deque>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "mcpgate/auth/http_client.h"
#include "mcpgate/auth/token_store.h"
#include "mcpgate/config/server_config.h"

namespace mcpgate {
namespace auth {

struct AuthorizationStart {
  std::string auth_url;
  std::string state;
  std::string callback_uri;
};

struct TokenExchangeResult {
  enum class Outcome {
    Success,   // token stored
    Rejected,  // provider answered with a non-200 status
    Failed     // transport, parse or storage failure
  };

  Outcome outcome{Outcome::Failed};
  int status_code{-1};
  nlohmann::json token;
};

/**
 * @brief Authorization-code flow against the provider
 *
 * begin() issues a fresh state value; acceptState() consumes it when the
 * provider redirects back. exchangeCode() blocks on the token endpoint and
 * must run on a worker thread.
 */
class OAuthFlow {
 public:
  OAuthFlow(const config::WhoopConfig& config,
            HttpClientBase& http,
            TokenStore& store);

  bool configured() const { return !config_.client_id.empty(); }

  AuthorizationStart begin();

  // True once per state issued by begin() within the last 10 minutes
  bool acceptState(const std::string& state);

  TokenExchangeResult exchangeCode(const std::string& code);

 private:
  struct PendingState {
    std::string value;
    std::chrono::steady_clock::time_point issued;
  };

  void expireStates(std::chrono::steady_clock::time_point now);

  config::WhoopConfig config_;
  HttpClientBase& http_;
  TokenStore& store_;

  std::mutex states_mutex_;
  std::deque<PendingState> pending_states_;
};

}  // namespace auth
}  // namespace mcpgate

#endif  // MCPGATE_AUTH_OAUTH_FLOW_H
