#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

// Heterogeneous lookup for string keyed containers
struct TransparentStringHash {
  using is_transparent = void;

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

using LogContext = std::unordered_map<std::string, std::string,
                                      TransparentStringHash, std::equal_to<>>;
using ComponentSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  std::string logFile = "logs/accounts.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  ComponentSet componentFilter; // Empty = all components
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};

  LogMetrics() = default;

  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
    }
    return *this;
  }
};

/**
 * @brief Process-wide line logger.
 *
 * Writes TEXT (`[ts] [LEVEL] [Component] message | k=v`) or JSON lines to the
 * console and, optionally, to a size-rotated file. Safe to call from any
 * server thread.
 */
class Logger {
public:
  static Logger &getInstance();

  // Configuration methods
  void configure(const LogConfig &config);
  void setLogLevel(LogLevel level);
  void setLogFormat(LogFormat format);
  void setLogFile(const std::string &filename);
  void enableConsoleOutput(bool enable);
  void enableFileOutput(bool enable);
  void setComponentFilter(const ComponentSet &components);
  void enableRotation(bool enable, size_t maxFileSize = 10 * 1024 * 1024,
                      int maxBackupFiles = 5);
  LogConfig getConfig() const;

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  LogMetrics getMetrics() const;

  // Rendering without output, used by tests and by the file writer
  std::string formatMessage(LogLevel level, const std::string &component,
                            const std::string &message,
                            const LogContext &context) const;
  bool shouldLog(LogLevel level, const std::string &component) const;

  void flush();
  void shutdown();

private:
  Logger() = default;
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::ofstream fileStream_;
  std::string currentLogFile_;
  size_t currentFileSize_ = 0;
  std::mutex fileMutex_;

  // Serializes console lines across threads
  std::mutex consoleMutex_;

  LogMetrics metrics_;

  static std::string formatTimestamp();
  static std::string levelToString(LogLevel level);
  static std::string escapeJson(const std::string &str);
  std::string formatTextMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  std::string formatJsonMessage(LogLevel level, const std::string &component,
                                const std::string &message,
                                const LogContext &context) const;
  void openLogFile(const std::string &filename);
  void writeLog(const std::string &formattedMessage);
  void rotateLogFile();
};

#define LOG_DEBUG(component, message, ...)                                     \
  Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"
