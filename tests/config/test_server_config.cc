/**
 * @file test_server_config.cc
 * @brief Layered configuration tests: YAML, environment, command line
 */

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "mcpgate/config/server_config.h"

namespace mcpgate {
namespace config {
namespace {

class ServerConfigTest : public ::testing::Test {
 protected:
  ConfigLoader loader() {
    return ConfigLoader([this](const std::string& name) -> const char* {
      auto it = env_.find(name);
      return it == env_.end() ? nullptr : it->second.c_str();
    });
  }

  CommandLineOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "mcpgate_server");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(&arg[0]);
    }
    return parseCommandLine(static_cast<int>(argv.size()), argv.data());
  }

  std::string writeTempFile(const std::string& content) {
    char path_template[] = "/tmp/mcpgate_config_XXXXXX";
    int fd = mkstemp(path_template);
    EXPECT_GE(fd, 0);
    close(fd);
    std::ofstream out(path_template);
    out << content;
    temp_files_.push_back(path_template);
    return path_template;
  }

  void TearDown() override {
    for (const auto& path : temp_files_) {
      std::remove(path.c_str());
    }
  }

  std::map<std::string, std::string> env_;
  std::vector<std::string> temp_files_;
};

TEST_F(ServerConfigTest, Defaults) {
  ServerConfig config;
  EXPECT_EQ(config.host, "0.0.0.0");
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.environment, "development");
  EXPECT_EQ(config.rate_limit.max_requests, 60u);
  EXPECT_EQ(config.rate_limit.window.count(), 60);
  EXPECT_EQ(config.max_message_bytes, 10000u);
  EXPECT_EQ(config.max_method_length, 100u);
  EXPECT_FALSE(config.isProduction());
}

TEST_F(ServerConfigTest, LoadGeneratesSecretWhenMissing) {
  auto config = loader().load(CommandLineOptions());

  EXPECT_TRUE(config.api_secret_generated);
  EXPECT_EQ(config.api_secret_key.size(), 43u);
}

TEST_F(ServerConfigTest, EnvironmentOverridesDefaults) {
  env_["HOST"] = "127.0.0.1";
  env_["PORT"] = "9000";
  env_["API_SECRET_KEY"] = "from-env-secret";
  env_["ENVIRONMENT"] = "production";
  env_["WHOOP_CLIENT_ID"] = "cid";
  env_["WHOOP_CLIENT_SECRET"] = "csecret";
  env_["WHOOP_TOKEN_FILE"] = "/tmp/token.json";

  auto config = loader().load(CommandLineOptions());

  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 9000);
  EXPECT_EQ(config.api_secret_key, "from-env-secret");
  EXPECT_FALSE(config.api_secret_generated);
  EXPECT_TRUE(config.isProduction());
  EXPECT_EQ(config.whoop.client_id, "cid");
  EXPECT_EQ(config.whoop.client_secret, "csecret");
  EXPECT_EQ(config.token_file, "/tmp/token.json");
}

TEST_F(ServerConfigTest, EmptyEnvironmentValueIsUnset) {
  env_["PORT"] = "";
  auto config = loader().load(CommandLineOptions());
  EXPECT_EQ(config.port, 8080);
}

TEST_F(ServerConfigTest, InvalidPortInEnvironment) {
  env_["PORT"] = "eighty";
  EXPECT_THROW(loader().load(CommandLineOptions()), ConfigError);

  env_["PORT"] = "70000";
  EXPECT_THROW(loader().load(CommandLineOptions()), ConfigError);
}

TEST_F(ServerConfigTest, YamlSections) {
  ServerConfig config;
  loader().applyYamlString(R"(
server:
  host: 127.0.0.1
  port: 8443
  tool_workers: 8
security:
  api_secret_key: yaml-secret
  rate_limit:
    max_requests: 10
    window_seconds: 30
limits:
  max_message_bytes: 5000
logging:
  level: warning
whoop:
  client_id: yaml-client
  request_timeout_seconds: 15
)",
                           "inline", config);

  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 8443);
  EXPECT_EQ(config.tool_workers, 8u);
  EXPECT_EQ(config.api_secret_key, "yaml-secret");
  EXPECT_EQ(config.rate_limit.max_requests, 10u);
  EXPECT_EQ(config.rate_limit.window.count(), 30);
  EXPECT_EQ(config.max_message_bytes, 5000u);
  EXPECT_EQ(config.max_method_length, 100u);
  EXPECT_EQ(config.log_level, "warning");
  EXPECT_EQ(config.whoop.client_id, "yaml-client");
  EXPECT_EQ(config.whoop.request_timeout.count(), 15);
}

TEST_F(ServerConfigTest, YamlVariableExpansion) {
  env_["GATEWAY_SECRET"] = "expanded-secret";
  ServerConfig config;
  loader().applyYamlString(R"(
security:
  api_secret_key: ${GATEWAY_SECRET}
server:
  host: ${BIND_HOST:-10.0.0.5}
)",
                           "inline", config);

  EXPECT_EQ(config.api_secret_key, "expanded-secret");
  EXPECT_EQ(config.host, "10.0.0.5");
}

TEST_F(ServerConfigTest, UndefinedVariableWithoutDefaultFails) {
  EXPECT_THROW(loader().expandVariables("key: ${NOT_SET_ANYWHERE}"),
               ConfigError);
  EXPECT_EQ(loader().expandVariables("plain text"), "plain text");
}

TEST_F(ServerConfigTest, YamlErrorsNameTheField) {
  ServerConfig config;
  try {
    loader().applyYamlString("server:\n  port: not-a-port\n", "inline",
                             config);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.field(), "server.port");
  }

  try {
    loader().applyYamlString("limits:\n  max_message_bytes: -5\n", "inline",
                             config);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(e.field(), "limits.max_message_bytes");
    EXPECT_EQ(e.file(), "inline");
  }

  EXPECT_THROW(loader().applyYamlString("server: [1, 2]\n", "inline", config),
               ConfigError);
  EXPECT_THROW(loader().applyYamlString("- a\n- b\n", "inline", config),
               ConfigError);
  EXPECT_THROW(loader().applyYamlString("server: {host: [\n", "inline", config),
               ConfigError);
}

TEST_F(ServerConfigTest, EmptyYamlIsAccepted) {
  ServerConfig config;
  loader().applyYamlString("", "inline", config);
  EXPECT_EQ(config.port, 8080);
}

TEST_F(ServerConfigTest, PrecedenceFileThenEnvThenFlags) {
  auto path = writeTempFile(
      "server:\n  host: file-host\n  port: 7000\n"
      "security:\n  api_secret_key: file-secret\n");
  env_["PORT"] = "7100";

  auto options = parse({"--config", path, "--host", "flag-host"});
  auto config = loader().load(options);

  EXPECT_EQ(config.host, "flag-host");
  EXPECT_EQ(config.port, 7100);
  EXPECT_EQ(config.api_secret_key, "file-secret");
}

TEST_F(ServerConfigTest, ConfigPathFromEnvironment) {
  auto path = writeTempFile("server:\n  port: 7200\n");
  env_["MCPGATE_CONFIG"] = path;

  EXPECT_EQ(loader().load(CommandLineOptions()).port, 7200);
}

TEST_F(ServerConfigTest, MissingConfigFileFails) {
  CommandLineOptions options;
  options.config_path = "/nonexistent/mcpgate.yaml";
  EXPECT_THROW(loader().load(options), ConfigError);
}

TEST_F(ServerConfigTest, CommandLineFlags) {
  auto options = parse({"--port=9100", "-v", "--host", "::1"});
  EXPECT_EQ(options.port, 9100);
  EXPECT_TRUE(options.verbose);
  EXPECT_EQ(options.host, "::1");
  EXPECT_FALSE(options.help);

  EXPECT_TRUE(parse({"--help"}).help);
  EXPECT_THROW(parse({"--bogus"}), ConfigError);
  EXPECT_THROW(parse({"--port"}), ConfigError);
  EXPECT_THROW(parse({"--port", "0"}), ConfigError);
}

TEST_F(ServerConfigTest, VerboseForcesDebugLevel) {
  env_["LOG_LEVEL"] = "error";
  auto config = loader().load(parse({"--verbose"}));
  EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ServerConfigTest, ValidationRejectsBadValues) {
  ServerConfig config;
  config.api_secret_key = "k";
  EXPECT_NO_THROW(config.validate());

  auto bad = config;
  bad.environment = "staging";
  EXPECT_THROW(bad.validate(), ConfigError);

  bad = config;
  bad.log_level = "verbose";
  EXPECT_THROW(bad.validate(), ConfigError);

  bad = config;
  bad.max_frame_bytes = bad.max_message_bytes - 1;
  EXPECT_THROW(bad.validate(), ConfigError);

  bad = config;
  bad.tool_workers = 65;
  EXPECT_THROW(bad.validate(), ConfigError);

  bad = config;
  bad.api_secret_key.clear();
  EXPECT_THROW(bad.validate(), ConfigError);
}

TEST_F(ServerConfigTest, ErrorMessageFormat) {
  ConfigError error("must be positive", "limits.max_frame_bytes", "gw.yaml");
  EXPECT_STREQ(error.what(),
               "Configuration error in gw.yaml at field "
               "'limits.max_frame_bytes': must be positive");
}

TEST_F(ServerConfigTest, HomeDirectoryExpansion) {
  EXPECT_EQ(expandHomeDirectory("/abs/path"), "/abs/path");
  EXPECT_EQ(expandHomeDirectory("~other/x"), "~other/x");
  const char* home = std::getenv("HOME");
  if (home && *home) {
    EXPECT_EQ(expandHomeDirectory("~/t.json"), std::string(home) + "/t.json");
  }
}

}  // namespace
}  // namespace config
}  // namespace mcpgate
