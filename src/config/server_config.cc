#define MCPGATE_LOG_COMPONENT "config.loader"

#include "mcpgate/config/server_config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "mcpgate/auth/access_guard.h"
#include "mcpgate/logging/log_macros.h"

namespace mcpgate {
namespace config {

namespace {

constexpr size_t kMaxConfigFileSize = 1024 * 1024;
constexpr int64_t kMaxToolWorkers = 64;

const char* const kLogLevels[] = {"debug", "info",     "notice",
                                  "warning", "error", "critical",
                                  "alert", "emergency", "off"};

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool parseInteger(const std::string& text, int64_t& out) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  out = static_cast<int64_t>(value);
  return true;
}

uint16_t parsePort(const std::string& text, const std::string& field) {
  int64_t value = 0;
  if (!parseInteger(text, value) || value < 1 || value > 65535) {
    throw ConfigError("invalid port '" + text + "'", field);
  }
  return static_cast<uint16_t>(value);
}

YAML::Node section(const YAML::Node& root,
                   const char* key,
                   const std::string& source) {
  YAML::Node node = root[key];
  if (node && !node.IsNull() && !node.IsMap()) {
    throw ConfigError("expected a mapping", key, source);
  }
  return node;
}

template <typename T>
bool readScalar(const YAML::Node& parent,
                const char* key,
                const std::string& field,
                const std::string& source,
                T& out) {
  if (!parent || !parent.IsMap()) {
    return false;
  }
  YAML::Node node = parent[key];
  if (!node || node.IsNull()) {
    return false;
  }
  if (!node.IsScalar()) {
    throw ConfigError("expected a scalar value", field, source);
  }
  try {
    out = node.as<T>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError("invalid value '" + node.Scalar() + "'", field, source);
  }
  return true;
}

size_t readPositive(const YAML::Node& parent,
                    const char* key,
                    const std::string& field,
                    const std::string& source,
                    size_t current) {
  int64_t value = 0;
  if (!readScalar(parent, key, field, source, value)) {
    return current;
  }
  if (value <= 0) {
    throw ConfigError("must be a positive integer", field, source);
  }
  return static_cast<size_t>(value);
}

}  // namespace

std::string ConfigError::formatError(const std::string& message,
                                     const std::string& field,
                                     const std::string& file) {
  std::ostringstream oss;
  oss << "Configuration error";
  if (!file.empty()) {
    oss << " in " << file;
  }
  if (!field.empty()) {
    oss << " at field '" << field << "'";
  }
  oss << ": " << message;
  return oss.str();
}

void ServerConfig::validate() const {
  if (host.empty()) {
    throw ConfigError("must not be empty", "server.host");
  }
  if (port == 0) {
    throw ConfigError("must be between 1 and 65535", "server.port");
  }
  if (environment != "development" && environment != "production") {
    throw ConfigError("must be 'development' or 'production', got '" +
                          environment + "'",
                      "server.environment");
  }
  if (api_secret_key.empty()) {
    throw ConfigError("must not be empty", "security.api_secret_key");
  }
  if (rate_limit.max_requests == 0) {
    throw ConfigError("must be positive", "security.rate_limit.max_requests");
  }
  if (rate_limit.window.count() <= 0) {
    throw ConfigError("must be positive",
                      "security.rate_limit.window_seconds");
  }
  if (max_message_bytes == 0) {
    throw ConfigError("must be positive", "limits.max_message_bytes");
  }
  if (max_method_length == 0) {
    throw ConfigError("must be positive", "limits.max_method_length");
  }
  if (max_frame_bytes < max_message_bytes) {
    throw ConfigError("must not be smaller than limits.max_message_bytes",
                      "limits.max_frame_bytes");
  }
  if (tool_workers == 0 || tool_workers > static_cast<size_t>(kMaxToolWorkers)) {
    throw ConfigError("must be between 1 and 64", "server.tool_workers");
  }
  auto level = toLower(log_level);
  if (std::find(std::begin(kLogLevels), std::end(kLogLevels), level) ==
      std::end(kLogLevels)) {
    throw ConfigError("unknown log level '" + log_level + "'",
                      "logging.level");
  }
  if (token_file.empty()) {
    throw ConfigError("must not be empty", "whoop.token_file");
  }
  if (whoop.request_timeout.count() <= 0) {
    throw ConfigError("must be positive", "whoop.request_timeout_seconds");
  }
}

CommandLineOptions parseCommandLine(int argc, char** argv) {
  CommandLineOptions options;

  auto take_value = [&](int& i, const std::string& arg,
                        const std::string& flag) -> std::string {
    if (arg.size() > flag.size() && arg[flag.size()] == '=') {
      return arg.substr(flag.size() + 1);
    }
    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + flag, flag);
    }
    return argv[++i];
  };
  auto matches = [](const std::string& arg, const std::string& flag) {
    return arg == flag || arg.compare(0, flag.size() + 1, flag + "=") == 0;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (matches(arg, "--config")) {
      options.config_path = take_value(i, arg, "--config");
    } else if (matches(arg, "--host")) {
      options.host = take_value(i, arg, "--host");
      if (options.host.empty()) {
        throw ConfigError("must not be empty", "--host");
      }
    } else if (matches(arg, "--port")) {
      options.port = parsePort(take_value(i, arg, "--port"), "--port");
    } else {
      throw ConfigError("unknown option '" + arg + "'");
    }
  }
  return options;
}

std::string usageText(const char* program) {
  std::ostringstream oss;
  oss << "Usage: " << program << " [options]\n"
      << "  --config PATH   YAML configuration file (or MCPGATE_CONFIG)\n"
      << "  --host HOST     Bind address (default 0.0.0.0)\n"
      << "  --port PORT     Listen port (default 8080)\n"
      << "  --verbose, -v   Debug logging, and print a generated API key\n"
      << "  --help, -h      Show this help\n";
  return oss.str();
}

std::string expandHomeDirectory(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path;  // ~user is not supported
  }
  const char* home = std::getenv("HOME");
  if (!home || !*home) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

ConfigLoader::ConfigLoader(EnvLookup env) : env_(std::move(env)) {
  if (!env_) {
    env_ = [](const std::string& name) { return std::getenv(name.c_str()); };
  }
}

const char* ConfigLoader::lookup(const std::string& name) const {
  const char* value = env_(name);
  return (value && *value) ? value : nullptr;
}

std::string ConfigLoader::expandVariables(const std::string& content) const {
  static const std::regex env_regex(
      R"(\$\{([A-Za-z_][A-Za-z0-9_]*)(:-([^}]*))?\})");
  std::string result;
  size_t vars_expanded = 0;

  auto begin = content.cbegin();
  std::smatch match;
  while (std::regex_search(begin, content.cend(), match, env_regex)) {
    std::string var_name = match[1].str();
    bool has_default = match[2].matched;
    const char* env_value = lookup(var_name);

    if (!env_value && !has_default) {
      MCPGATE_LOG(Error, "Undefined environment variable without default: {}",
                  var_name);
      throw ConfigError("undefined environment variable ${" + var_name + "}");
    }

    result.append(begin, match[0].first);
    result += env_value ? std::string(env_value) : match[3].str();
    ++vars_expanded;
    begin = match[0].second;
  }
  result.append(begin, content.cend());

  if (vars_expanded > 0) {
    MCPGATE_LOG(Debug, "Expanded {} environment variables", vars_expanded);
  }
  return result;
}

void ConfigLoader::applyYamlFile(const std::string& path,
                                 ServerConfig& config) const {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    MCPGATE_LOG(Error, "Failed to open configuration file: {}", path);
    throw ConfigError("cannot open file", "", path);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (content.size() > kMaxConfigFileSize) {
    throw ConfigError("file too large (" + std::to_string(content.size()) +
                          " bytes)",
                      "", path);
  }
  MCPGATE_LOG(Info, "Loading configuration file: {} ({} bytes)", path,
              content.size());
  applyYamlString(content, path, config);
}

void ConfigLoader::applyYamlString(const std::string& raw,
                                   const std::string& source,
                                   ServerConfig& config) const {
  std::string content = expandVariables(raw);

  YAML::Node root;
  try {
    root = YAML::Load(content);
  } catch (const YAML::ParserException& e) {
    std::ostringstream error;
    error << "YAML parse error at line " << e.mark.line + 1 << ", column "
          << e.mark.column + 1;
    throw ConfigError(error.str(), "", source);
  }
  if (!root || root.IsNull()) {
    MCPGATE_LOG(Warning, "Configuration file {} is empty", source);
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("top-level value must be a mapping", "", source);
  }

  auto server = section(root, "server", source);
  readScalar(server, "host", "server.host", source, config.host);
  std::string port_text;
  if (readScalar(server, "port", "server.port", source, port_text)) {
    config.port = parsePort(port_text, "server.port");
  }
  readScalar(server, "environment", "server.environment", source,
             config.environment);
  config.tool_workers = readPositive(server, "tool_workers",
                                     "server.tool_workers", source,
                                     config.tool_workers);

  auto security = section(root, "security", source);
  readScalar(security, "api_secret_key", "security.api_secret_key", source,
             config.api_secret_key);
  if (security && security.IsMap()) {
    auto rate_limit = security["rate_limit"];
    if (rate_limit && !rate_limit.IsNull() && !rate_limit.IsMap()) {
      throw ConfigError("expected a mapping", "security.rate_limit", source);
    }
    config.rate_limit.max_requests = static_cast<uint32_t>(readPositive(
        rate_limit, "max_requests", "security.rate_limit.max_requests",
        source, config.rate_limit.max_requests));
    config.rate_limit.window = std::chrono::seconds(readPositive(
        rate_limit, "window_seconds", "security.rate_limit.window_seconds",
        source, static_cast<size_t>(config.rate_limit.window.count())));
  }

  auto limits = section(root, "limits", source);
  config.max_message_bytes =
      readPositive(limits, "max_message_bytes", "limits.max_message_bytes",
                   source, config.max_message_bytes);
  config.max_method_length =
      readPositive(limits, "max_method_length", "limits.max_method_length",
                   source, config.max_method_length);
  config.max_frame_bytes =
      readPositive(limits, "max_frame_bytes", "limits.max_frame_bytes",
                   source, config.max_frame_bytes);

  auto logging = section(root, "logging", source);
  readScalar(logging, "level", "logging.level", source, config.log_level);
  readScalar(logging, "file", "logging.file", source, config.log_file);

  auto whoop = section(root, "whoop", source);
  readScalar(whoop, "client_id", "whoop.client_id", source,
             config.whoop.client_id);
  readScalar(whoop, "client_secret", "whoop.client_secret", source,
             config.whoop.client_secret);
  readScalar(whoop, "redirect_uri", "whoop.redirect_uri", source,
             config.whoop.redirect_uri);
  readScalar(whoop, "api_base_url", "whoop.api_base_url", source,
             config.whoop.api_base_url);
  readScalar(whoop, "auth_url", "whoop.auth_url", source,
             config.whoop.auth_url);
  readScalar(whoop, "token_url", "whoop.token_url", source,
             config.whoop.token_url);
  readScalar(whoop, "scopes", "whoop.scopes", source, config.whoop.scopes);
  readScalar(whoop, "token_file", "whoop.token_file", source,
             config.token_file);
  config.whoop.request_timeout = std::chrono::seconds(readPositive(
      whoop, "request_timeout_seconds", "whoop.request_timeout_seconds",
      source, static_cast<size_t>(config.whoop.request_timeout.count())));
}

void ConfigLoader::applyEnvironment(ServerConfig& config) const {
  if (const char* value = lookup("HOST")) {
    config.host = value;
  }
  if (const char* value = lookup("PORT")) {
    config.port = parsePort(value, "PORT");
  }
  if (const char* value = lookup("API_SECRET_KEY")) {
    config.api_secret_key = value;
  }
  if (const char* value = lookup("ENVIRONMENT")) {
    config.environment = value;
  }
  if (const char* value = lookup("LOG_LEVEL")) {
    config.log_level = value;
  }
  if (const char* value = lookup("WHOOP_CLIENT_ID")) {
    config.whoop.client_id = value;
  }
  if (const char* value = lookup("WHOOP_CLIENT_SECRET")) {
    config.whoop.client_secret = value;
  }
  if (const char* value = lookup("WHOOP_REDIRECT_URI")) {
    config.whoop.redirect_uri = value;
  }
  if (const char* value = lookup("WHOOP_TOKEN_FILE")) {
    config.token_file = value;
  }
}

void ConfigLoader::applyCommandLine(const CommandLineOptions& options,
                                    ServerConfig& config) const {
  if (!options.host.empty()) {
    config.host = options.host;
  }
  if (options.port > 0) {
    config.port = static_cast<uint16_t>(options.port);
  }
  if (options.verbose) {
    config.log_level = "debug";
  }
}

ServerConfig ConfigLoader::load(const CommandLineOptions& options) const {
  ServerConfig config;

  std::string path = options.config_path;
  if (path.empty()) {
    if (const char* env_path = lookup("MCPGATE_CONFIG")) {
      path = env_path;
      MCPGATE_LOG(Info, "Configuration file taken from MCPGATE_CONFIG");
    }
  }
  if (!path.empty()) {
    applyYamlFile(path, config);
  }

  applyEnvironment(config);
  applyCommandLine(options, config);

  if (config.api_secret_key.empty()) {
    try {
      config.api_secret_key = auth::generateUrlSafeToken(32);
    } catch (const std::runtime_error& e) {
      throw ConfigError(std::string("cannot generate secret: ") + e.what(),
                        "security.api_secret_key");
    }
    config.api_secret_generated = true;
  }
  config.token_file = expandHomeDirectory(config.token_file);

  config.validate();
  return config;
}

}  // namespace config
}  // namespace mcpgate
