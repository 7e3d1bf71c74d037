#ifndef MCPGATE_AUTH_ACCESS_GUARD_H
#define MCPGATE_AUTH_ACCESS_GUARD_H

#include <cstddef>
#include <string>

/**
 * @file access_guard.h
 * @brief Shared-secret credential check for the upgrade and HTTP boundaries
 */

namespace mcpgate {
namespace auth {

/**
 * @brief Generate a random URL-safe token
 * @param num_bytes Number of random bytes before encoding
 * @return base64url text without padding
 * @throws std::runtime_error if the OpenSSL RNG fails
 */
std::string generateUrlSafeToken(size_t num_bytes = 32);

/**
 * @brief base64url encoding without padding (RFC 4648 section 5)
 */
std::string base64UrlEncode(const std::string& data);

/**
 * @brief Mask a secret for log output
 *
 * Keeps at most the first 4 characters; secrets of 8 characters or fewer
 * are masked entirely.
 */
std::string maskSecret(const std::string& secret);

/**
 * @brief Validates a presented credential against the process secret
 *
 * The secret is fixed for the lifetime of the guard. Comparison is
 * constant-time over the secret length.
 */
class AccessGuard {
 public:
  explicit AccessGuard(const std::string& secret);

  /**
   * @brief True iff presented is non-empty and equals the secret
   */
  bool authorize(const std::string& presented) const;

  /**
   * @brief Whether an HTTP path needs a credential
   *
   * Prefix match against /mcp, /auth and /tools. /whoop/auth is public.
   */
  static bool requiresCredential(const std::string& path);

  std::string maskedSecret() const { return maskSecret(secret_); }

 private:
  std::string secret_;
};

}  // namespace auth
}  // namespace mcpgate

#endif  // MCPGATE_AUTH_ACCESS_GUARD_H
