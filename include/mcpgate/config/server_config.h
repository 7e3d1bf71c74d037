/**
 * @file server_config.h
 * @brief Gateway configuration: defaults, YAML file, environment, CLI
 *
 * Sources are applied in increasing precedence:
 *   1. built-in defaults
 *   2. YAML file (--config or MCPGATE_CONFIG)
 *   3. environment variables (HOST, PORT, API_SECRET_KEY, ...)
 *   4. command-line flags (--host, --port, --verbose)
 *
 * YAML scalars may reference ${VAR} or ${VAR:-default}.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace mcpgate {
namespace config {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message,
                       const std::string& field = "",
                       const std::string& file = "")
      : std::runtime_error(formatError(message, field, file)),
        field_(field),
        file_(file) {}

  const std::string& field() const { return field_; }
  const std::string& file() const { return file_; }

 private:
  static std::string formatError(const std::string& message,
                                 const std::string& field,
                                 const std::string& file);

  std::string field_;
  std::string file_;
};

struct WhoopConfig {
  std::string client_id;
  std::string client_secret;
  std::string redirect_uri = "https://whoop-mcp.fly.dev/whoop/callback";
  std::string api_base_url = "https://api.prod.whoop.com/developer/v2";
  std::string auth_url = "https://api.prod.whoop.com/oauth/oauth2/auth";
  std::string token_url = "https://api.prod.whoop.com/oauth/oauth2/token";
  std::string scopes =
      "read:profile read:body_measurement read:cycles read:recovery "
      "read:sleep read:workout";
  std::chrono::seconds request_timeout{30};
};

struct RateLimitSettings {
  uint32_t max_requests = 60;
  std::chrono::seconds window{60};
};

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  std::string environment = "development";

  std::string api_secret_key;
  // Set when api_secret_key was generated rather than supplied
  bool api_secret_generated = false;

  RateLimitSettings rate_limit;
  size_t max_message_bytes = 10000;
  size_t max_method_length = 100;
  size_t max_frame_bytes = 1024 * 1024;
  size_t tool_workers = 4;

  std::string token_file = "~/.whoop_token.json";
  std::string log_level = "info";
  std::string log_file;

  WhoopConfig whoop;

  bool isProduction() const { return environment == "production"; }

  /**
   * @throws ConfigError naming the first invalid field
   */
  void validate() const;
};

struct CommandLineOptions {
  std::string config_path;
  std::string host;
  int port = -1;  // -1 when not given
  bool verbose = false;
  bool help = false;
};

/**
 * @throws ConfigError on unknown flags or malformed values
 */
CommandLineOptions parseCommandLine(int argc, char** argv);

std::string usageText(const char* program);

// Replaces a leading "~" with $HOME
std::string expandHomeDirectory(const std::string& path);

class ConfigLoader {
 public:
  // Returns nullptr for unset variables
  using EnvLookup = std::function<const char*(const std::string&)>;

  explicit ConfigLoader(EnvLookup env = nullptr);

  /**
   * @brief Build the effective configuration from every source
   *
   * Generates a random api_secret_key when none is supplied, expands the
   * token path and validates the result.
   * @throws ConfigError
   */
  ServerConfig load(const CommandLineOptions& options) const;

  void applyYamlFile(const std::string& path, ServerConfig& config) const;
  void applyYamlString(const std::string& content,
                       const std::string& source,
                       ServerConfig& config) const;
  void applyEnvironment(ServerConfig& config) const;
  void applyCommandLine(const CommandLineOptions& options,
                        ServerConfig& config) const;

  /**
   * @brief Expand ${VAR} and ${VAR:-default}
   * @throws ConfigError for an unset variable without default
   */
  std::string expandVariables(const std::string& text) const;

 private:
  const char* lookup(const std::string& name) const;

  EnvLookup env_;
};

}  // namespace config
}  // namespace mcpgate
