#include "config_manager.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace accounts {

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_WARN("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json jsonConfig;
  try {
    file >> jsonConfig;
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }
  return parseJson(jsonConfig);
}

bool ConfigManager::loadFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig;
  try {
    jsonConfig = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::parse_error &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
  return parseJson(jsonConfig);
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  configData_.clear();
}

bool ConfigManager::parseJson(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  std::unordered_map<std::string, std::string, TransparentStringHash,
                     std::equal_to<>>
      flattened;
  flattenJson(jsonConfig, "", 0, 32, flattened);

  size_t count = flattened.size();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    configData_ = std::move(flattened);
  }
  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  count);
  return true;
}

void ConfigManager::flattenJson(
    const nlohmann::json &json, const std::string &prefix, int currentDepth,
    int maxDepth,
    std::unordered_map<std::string, std::string, TransparentStringHash,
                       std::equal_to<>> &out) const {
  if (currentDepth >= maxDepth) {
    out[prefix.empty() ? "deep_nested" : prefix + ".deep_nested"] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth, out);
    } else if (it->is_array()) {
      out[key] = it->dump();
    } else if (it->is_string()) {
      out[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      out[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      out[key] = it->get<bool>() ? "true" : "false";
    } else {
      out[key] = it->dump();
    }
  }
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stoi(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    std::string value = it->second;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value == "true" || value == "1" || value == "yes" || value == "on";
  }
  return defaultValue;
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    try {
      return std::stod(it->second);
    } catch (const std::invalid_argument &) {
      return defaultValue;
    } catch (const std::out_of_range &) {
      return defaultValue;
    }
  }
  return defaultValue;
}

ComponentSet ConfigManager::getStringSet(const std::string &key) const {
  ComponentSet result;
  std::string raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    nlohmann::json arr = nlohmann::json::parse(raw, nullptr, false);
    if (arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string())
          result.insert(v.get<std::string>());
      }
      return result;
    }
  }

  // Comma separated fallback
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty())
      result.insert(item);
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return configData_.find(key) != configData_.end();
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.logFile = getString("logging.log_file", "logs/accounts.log");
  int maxFileSize =
      getInt("logging.max_file_size", static_cast<int>(config.maxFileSize));
  if (maxFileSize < 0) {
    CONFIG_LOG_WARN("logging.max_file_size {} is negative, using {}",
                    maxFileSize, config.maxFileSize);
  } else {
    config.maxFileSize = static_cast<size_t>(maxFileSize);
  }
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");

  return config;
}

ServerConfig ConfigManager::getServerConfig() const {
  ServerConfig config;

  config.address = getString("server.address", config.address);

  int port = getInt("server.port", config.port);
  if (port < 0 || port > 65535) {
    CONFIG_LOG_WARN("server.port {} out of range, using {}", port,
                    config.port);
  } else {
    config.port = static_cast<unsigned short>(port);
  }

  config.threads = getInt("server.threads", config.threads);
  config.requestTimeout = std::chrono::seconds(getInt(
      "server.request_timeout", static_cast<int>(config.requestTimeout.count())));
  int maxBodySize = getInt("server.max_body_size",
                           static_cast<int>(config.maxRequestBodySize));
  if (maxBodySize < 0) {
    CONFIG_LOG_WARN("server.max_body_size {} is negative, using {}",
                    maxBodySize, config.maxRequestBodySize);
  } else {
    config.maxRequestBodySize = static_cast<size_t>(maxBodySize);
  }
  config.serverName = getString("server.name", config.serverName);

  return config;
}

DocsConfig ConfigManager::getDocsConfig() const {
  DocsConfig config;
  config.theme = getString("docs.theme", config.theme);
  config.cdnUrl = getString("docs.cdn_url", config.cdnUrl);
  return config;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) {
  std::string level = levelStr;
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "INFO")
    return LogLevel::INFO;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) {
  std::string format = formatStr;
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  return format == "JSON" ? LogFormat::JSON : LogFormat::TEXT;
}

} // namespace accounts
