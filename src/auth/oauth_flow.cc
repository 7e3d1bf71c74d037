#define MCPGATE_LOG_COMPONENT "auth.oauth"

#include "mcpgate/auth/oauth_flow.h"

#include "mcpgate/auth/access_guard.h"
#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace auth {

namespace {

constexpr std::chrono::minutes kStateLifetime{10};
constexpr size_t kMaxPendingStates = 256;

}  // namespace

OAuthFlow::OAuthFlow(const config::WhoopConfig& config,
                     HttpClientBase& http,
                     TokenStore& store)
    : config_(config), http_(http), store_(store) {}

AuthorizationStart OAuthFlow::begin() {
  AuthorizationStart start;
  start.state = generateUrlSafeToken(32);
  start.callback_uri = config_.redirect_uri;
  start.auth_url = config_.auth_url + "?" +
                   encodeForm({{"response_type", "code"},
                               {"client_id", config_.client_id},
                               {"redirect_uri", config_.redirect_uri},
                               {"scope", config_.scopes},
                               {"state", start.state}});

  auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(states_mutex_);
  expireStates(now);
  if (pending_states_.size() >= kMaxPendingStates) {
    pending_states_.pop_front();
  }
  pending_states_.push_back(PendingState{start.state, now});
  MCPGATE_LOG(Info, "OAuth flow started, state {}", maskSecret(start.state));
  return start;
}

bool OAuthFlow::acceptState(const std::string& state) {
  if (state.empty()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(states_mutex_);
  expireStates(std::chrono::steady_clock::now());
  for (auto it = pending_states_.begin(); it != pending_states_.end(); ++it) {
    if (it->value == state) {
      pending_states_.erase(it);
      return true;
    }
  }
  return false;
}

void OAuthFlow::expireStates(std::chrono::steady_clock::time_point now) {
  while (!pending_states_.empty() &&
         now - pending_states_.front().issued > kStateLifetime) {
    pending_states_.pop_front();
  }
}

TokenExchangeResult OAuthFlow::exchangeCode(const std::string& code) {
  TokenExchangeResult result;

  HttpRequest request;
  request.url = config_.token_url;
  request.method = HttpMethod::POST;
  request.timeout = config_.request_timeout;
  request.headers["Content-Type"] = "application/x-www-form-urlencoded";
  request.headers["Accept"] = "application/json";
  request.body = encodeForm({{"grant_type", "authorization_code"},
                             {"code", code},
                             {"client_id", config_.client_id},
                             {"client_secret", config_.client_secret},
                             {"redirect_uri", config_.redirect_uri}});

  auto response = http_.request(request);
  result.status_code = response.status_code;

  if (response.transportFailed()) {
    MCPGATE_LOG(Error, "Token exchange transport failure: {}", response.error);
    return result;
  }

  if (response.status_code != 200) {
    MCPGATE_LOG(Error, "Token exchange failed: {} - {}", response.status_code,
                response.body.substr(0, 200));
    result.outcome = TokenExchangeResult::Outcome::Rejected;
    return result;
  }

  auto token = nlohmann::json::parse(response.body, nullptr, false);
  if (token.is_discarded() || !token.is_object()) {
    MCPGATE_LOG(Error, "Token endpoint returned a non-object body");
    return result;
  }

  if (!store_.save(token)) {
    return result;
  }

  MCPGATE_LOG(Info, "WHOOP authentication successful");
  result.outcome = TokenExchangeResult::Outcome::Success;
  result.token = std::move(token);
  return result;
}

}  // namespace auth
}  // namespace mcpgate
