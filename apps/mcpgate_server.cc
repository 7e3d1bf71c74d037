/**
 * WHOOP MCP gateway server
 *
 * Serves the MCP protocol over a websocket at /mcp, plus the health, info,
 * tool listing, token status and OAuth endpoints.
 *
 * USAGE:
 *   mcpgate_server [--config <file>] [--host <address>] [--port <port>]
 *                  [--verbose]
 *
 * The shared secret comes from API_SECRET_KEY (or security.api_secret_key
 * in the YAML file). Without one a temporary key is generated at start-up.
 */

#define MCPGATE_LOG_COMPONENT "main"

#include <signal.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

#include "mcpgate/auth/access_guard.h"
#include "mcpgate/auth/http_client.h"
#include "mcpgate/auth/oauth_flow.h"
#include "mcpgate/auth/token_store.h"
#include "mcpgate/config/server_config.h"
#include "mcpgate/event/event_loop.h"
#include "mcpgate/event/worker_pool.h"
#include "mcpgate/logging/log_macros.h"
#include "mcpgate/logging/log_sink.h"
#include "mcpgate/logging/logger_registry.h"
#include "mcpgate/server/gateway_server.h"
#include "mcpgate/server/tool_registry.h"
#include "mcpgate/tools/whoop_tools.h"

using namespace mcpgate;

namespace {

void configureLogging(const config::ServerConfig& config) {
  std::string level = config.log_level;
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto& registry = logging::LoggerRegistry::instance();
  registry.setGlobalLevel(logging::stringToLogLevel(level));

  std::shared_ptr<logging::LogSink> sink =
      config.log_file.empty()
          ? logging::SinkFactory::createStdioSink()
          : logging::SinkFactory::createFileSink(config.log_file);
  // Production logs are shipped to a collector
  if (config.isProduction()) {
    sink->setFormatter(std::make_unique<logging::JsonFormatter>());
  }
  registry.setDefaultSink(std::move(sink));
}

void announceSecret(const config::ServerConfig& config, bool verbose) {
  if (!config.api_secret_generated) {
    MCPGATE_LOG(Info, "Using configured API key {}",
                auth::maskSecret(config.api_secret_key));
    return;
  }
  MCPGATE_LOG(Warning,
              "API_SECRET_KEY not set! Using temporary key {}. Set "
              "API_SECRET_KEY for production.",
              auth::maskSecret(config.api_secret_key));
  // The full key only reaches the terminal on explicit request
  if (verbose && !config.isProduction()) {
    std::cerr << "Temporary API key: " << config.api_secret_key << std::endl;
  }
}

}  // namespace

int main(int argc, char** argv) {
  config::CommandLineOptions options;
  try {
    options = config::parseCommandLine(argc, argv);
  } catch (const config::ConfigError& e) {
    std::cerr << "[ERROR] " << e.what() << "\n\n" << config::usageText(argv[0]);
    return 1;
  }
  if (options.help) {
    std::cout << config::usageText(argv[0]);
    return 0;
  }

  config::ServerConfig config;
  try {
    config = config::ConfigLoader().load(options);
  } catch (const config::ConfigError& e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  configureLogging(config);
  announceSecret(config, options.verbose);

  try {
    // Declaration order is teardown order in reverse: the dispatcher must
    // outlive the workers that post to it
    auto dispatcher = event::createLibeventDispatcher("main");
    event::WorkerPool workers("tools", config.tool_workers);
    auth::HttpClient http;
    auth::TokenStore tokens(config.token_file);
    auth::OAuthFlow oauth(config.whoop, http, tokens);

    server::ToolRegistry registry;
    tools::registerWhoopTools(registry, workers, http, tokens, config.whoop);
    registry.seal();

    server::GatewayServer gateway(server::GatewayContext{
        config, *dispatcher, workers, registry, oauth, tokens});
    gateway.start();

    auto stop = [&gateway, &dispatcher]() {
      MCPGATE_LOG(Info, "Shutdown signal received");
      gateway.shutdown();
      dispatcher->exit();
    };
    auto sigint = dispatcher->listenForSignal(SIGINT, stop);
    auto sigterm = dispatcher->listenForSignal(SIGTERM, stop);

    dispatcher->run(event::RunType::RunUntilExit);

    gateway.shutdown();
    // Tools still running hold references to http and tokens
    workers.shutdown();
  } catch (const std::exception& e) {
    MCPGATE_LOG(Critical, "Server failed: {}", e.what());
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  MCPGATE_LOG(Info, "Server stopped");
  return 0;
}
