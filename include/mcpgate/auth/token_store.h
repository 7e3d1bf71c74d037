#ifndef MCPGATE_AUTH_TOKEN_STORE_H
#define MCPGATE_AUTH_TOKEN_STORE_H

#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcpgate {
namespace auth {

/**
 * @brief Persisted provider token (one JSON object on disk)
 *
 * Written by the OAuth callback, read by every tool invocation. Saves go
 * through a temporary file and rename so readers never see a partial
 * token. The file is created with mode 0600.
 */
class TokenStore {
 public:
  explicit TokenStore(const std::string& path);

  // nullopt when the file is missing, unreadable or not a JSON object
  std::optional<nlohmann::json> load() const;

  bool save(const nlohmann::json& token) const;

  std::optional<std::string> accessToken() const;

  /**
   * {"authenticated":true,"token_type":...,"expires_in":...}, or
   * {"authenticated":false} when no usable token is stored.
   */
  nlohmann::json status() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  mutable std::mutex mutex_;
};

}  // namespace auth
}  // namespace mcpgate

#endif  // MCPGATE_AUTH_TOKEN_STORE_H
