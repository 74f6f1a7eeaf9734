#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace accounts {

/**
 * @brief Listener and session settings for the HTTP server.
 */
struct ServerConfig {
  // Network binding
  std::string address = "127.0.0.1";
  unsigned short port = 8080;
  int threads = 4;

  // Session settings
  std::chrono::seconds requestTimeout{30};
  size_t maxRequestBodySize = 1024 * 1024; // 1MB
  std::string serverName = "Accounts API";

  struct ValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string &error) {
      isValid = false;
      errors.push_back(error);
    }

    void addWarning(const std::string &warning) {
      warnings.push_back(warning);
    }
  };

  ValidationResult validate() const {
    ValidationResult result;

    if (address.empty()) {
      result.addError("address must not be empty");
    }

    if (port == 0) {
      result.addWarning("port is 0, an ephemeral port will be chosen");
    }

    if (threads <= 0) {
      result.addError("threads must be greater than 0");
    } else if (threads > 256) {
      result.addWarning("threads is very high (" + std::to_string(threads) +
                        "), consider system resource limits");
    }

    if (requestTimeout.count() <= 0) {
      result.addError("requestTimeout must be positive");
    }

    if (maxRequestBodySize == 0) {
      result.addError("maxRequestBodySize must be greater than 0");
    }

    if (maxRequestBodySize > 100 * 1024 * 1024) { // 100MB
      result.addWarning("maxRequestBodySize is very large (" +
                        std::to_string(maxRequestBodySize / (1024 * 1024)) +
                        "MB), consider memory usage implications");
    }

    if (serverName.empty()) {
      result.addWarning("serverName is empty, responses will carry no Server "
                        "header value");
    }

    return result;
  }

  /**
   * @brief Replace unset or invalid parameters with their defaults
   */
  void applyDefaults() {
    if (address.empty()) {
      address = "127.0.0.1";
    }
    if (threads <= 0) {
      threads = 4;
    }
    if (requestTimeout.count() <= 0) {
      requestTimeout = std::chrono::seconds{30};
    }
    if (maxRequestBodySize == 0) {
      maxRequestBodySize = 1024 * 1024;
    }
  }

  static ServerConfig create(const std::string &address, unsigned short port,
                             int threads,
                             std::chrono::seconds requestTimeout =
                                 std::chrono::seconds{30}) {
    ServerConfig config;
    config.address = address;
    config.port = port;
    config.threads = threads;
    config.requestTimeout = requestTimeout;
    config.applyDefaults();
    return config;
  }

  bool operator==(const ServerConfig &other) const {
    return address == other.address && port == other.port &&
           threads == other.threads &&
           requestTimeout == other.requestTimeout &&
           maxRequestBodySize == other.maxRequestBodySize &&
           serverName == other.serverName;
  }

  bool operator!=(const ServerConfig &other) const { return !(*this == other); }
};

} // namespace accounts
