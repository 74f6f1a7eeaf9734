#pragma once

#include "logger.hpp"
#include "server_config.hpp"
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace accounts {

// Settings for the API reference page
struct DocsConfig {
  std::string theme = "laserwave";
  std::string cdnUrl = "https://cdn.jsdelivr.net/npm/@scalar/api-reference";

  bool operator==(const DocsConfig &other) const {
    return theme == other.theme && cdnUrl == other.cdnUrl;
  }
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  // Missing file or malformed JSON return false and keep the previous values
  bool loadConfig(const std::string &configPath);
  bool loadFromString(const std::string &jsonText);
  void clear();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  ComponentSet getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  LogConfig getLoggingConfig() const;
  ServerConfig getServerConfig() const;
  DocsConfig getDocsConfig() const;

  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);

private:
  ConfigManager() = default;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string, TransparentStringHash,
                     std::equal_to<>>
      configData_;

  bool parseJson(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth,
                   std::unordered_map<std::string, std::string,
                                      TransparentStringHash, std::equal_to<>>
                       &out) const;
};

} // namespace accounts
