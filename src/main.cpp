#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "accounts_exceptions.hpp"
#include "config_manager.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "request_handler.hpp"
#include "route_table.hpp"

namespace {

constexpr const char *CONFIG_FILE = "config.json";

std::atomic<bool> shutdownRequested{false};

void signalHandler(int) { shutdownRequested = true; }

} // namespace

int main() {
  try {
    auto &config = accounts::ConfigManager::getInstance();
    if (std::filesystem::exists(CONFIG_FILE)) {
      if (!config.loadConfig(CONFIG_FILE)) {
        std::cerr << "Failed to load configuration from " << CONFIG_FILE
                  << std::endl;
        return 1;
      }
    }

    auto &logger = Logger::getInstance();
    logger.configure(config.getLoggingConfig());
    LOG_INFO("Main", "Starting Accounts API");

    accounts::ServerConfig serverConfig = config.getServerConfig();
    auto validation = serverConfig.validate();
    for (const auto &warning : validation.warnings) {
      LOG_WARN("Main", "Server configuration: " + warning);
    }
    if (!validation.isValid) {
      for (const auto &error : validation.errors) {
        LOG_ERROR("Main", "Server configuration: " + error);
      }
      serverConfig.applyDefaults();
      LOG_INFO("Main", "Applied default values for invalid configuration");
    }

    accounts::DocsConfig docsConfig = config.getDocsConfig();
    accounts::RouteTable routes = accounts::buildRouteTable();
    auto requestHandler = std::make_shared<accounts::RequestHandler>(
        routes, serverConfig, docsConfig);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto server = std::make_unique<accounts::HttpServer>(
        serverConfig.address, serverConfig.port, serverConfig.threads,
        serverConfig);
    server->setRequestHandler(requestHandler);
    server->start();

    const std::string baseUrl = "http://" + serverConfig.address + ":" +
                                std::to_string(server->boundPort());
    LOG_INFO("Main", "Accounts API listening on " + baseUrl);
    LOG_INFO("Main", "API reference at " + baseUrl + "/api");

    while (server->isRunning() && !shutdownRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Main", "Shutting down gracefully");
    server->stop();
  } catch (const accounts::AccountsException &e) {
    LOG_FATAL("Main", "Startup failed: " + e.toLogString());
    Logger::getInstance().flush();
    return 1;
  } catch (const std::exception &e) {
    LOG_FATAL("Main", "Unhandled exception: " + std::string(e.what()));
    Logger::getInstance().flush();
    return 1;
  }

  LOG_INFO("Main", "Accounts API shutdown complete");
  Logger::getInstance().shutdown();
  return 0;
}
