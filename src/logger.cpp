#include "logger.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::~Logger() { shutdown(); }

void Logger::configure(const LogConfig &config) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_ = config;
  }

  std::lock_guard<std::mutex> fileLock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
  if (config.fileOutput) {
    openLogFile(config.logFile);
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.level = level;
}

void Logger::setLogFormat(LogFormat format) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.format = format;
}

void Logger::setLogFile(const std::string &filename) {
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.logFile = filename;
    config_.fileOutput = true;
  }
  std::lock_guard<std::mutex> fileLock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
  openLogFile(filename);
}

void Logger::enableConsoleOutput(bool enable) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.consoleOutput = enable;
}

void Logger::enableFileOutput(bool enable) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.fileOutput = enable;
}

void Logger::setComponentFilter(const ComponentSet &components) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.componentFilter = components;
}

void Logger::enableRotation(bool enable, size_t maxFileSize,
                            int maxBackupFiles) {
  std::lock_guard<std::mutex> lock(configMutex_);
  config_.enableRotation = enable;
  config_.maxFileSize = maxFileSize;
  config_.maxBackupFiles = maxBackupFiles;
}

LogConfig Logger::getConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return config_;
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message, const LogContext &context) {
  if (!shouldLog(level, component)) {
    return;
  }

  metrics_.totalMessages++;
  if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
    metrics_.errorCount++;
  } else if (level == LogLevel::WARN) {
    metrics_.warningCount++;
  }

  writeLog(formatMessage(level, component, message, context));
}

void Logger::debug(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string &component, const std::string &message,
                  const LogContext &context) {
  log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string &component, const std::string &message,
                   const LogContext &context) {
  log(LogLevel::FATAL, component, message, context);
}

LogMetrics Logger::getMetrics() const { return metrics_; }

void Logger::flush() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.flush();
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(fileMutex_);
  if (fileStream_.is_open()) {
    fileStream_.close();
  }
}

bool Logger::shouldLog(LogLevel level, const std::string &component) const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (level < config_.level) {
    return false;
  }
  if (!config_.componentFilter.empty() &&
      config_.componentFilter.find(component) ==
          config_.componentFilter.end()) {
    return false;
  }
  return true;
}

std::string Logger::formatTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  oss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::formatMessage(LogLevel level, const std::string &component,
                                  const std::string &message,
                                  const LogContext &context) const {
  LogFormat format;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    format = config_.format;
  }
  return format == LogFormat::JSON
             ? formatJsonMessage(level, component, message, context)
             : formatTextMessage(level, component, message, context);
}

std::string Logger::formatTextMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::ostringstream oss;
  oss << "[" << formatTimestamp() << "] "
      << "[" << levelToString(level) << "] "
      << "[" << component << "] " << message;

  if (!context.empty()) {
    oss << " |";
    for (const auto &[key, value] : context) {
      oss << " " << key << "=" << value;
    }
  }

  return oss.str();
}

std::string Logger::formatJsonMessage(LogLevel level,
                                      const std::string &component,
                                      const std::string &message,
                                      const LogContext &context) const {
  std::string levelName = levelToString(level);
  if (!levelName.empty() && levelName.back() == ' ') {
    levelName.pop_back();
  }

  std::ostringstream oss;
  oss << "{"
      << "\"timestamp\":\"" << formatTimestamp() << "\","
      << "\"level\":\"" << levelName << "\","
      << "\"component\":\"" << escapeJson(component) << "\","
      << "\"message\":\"" << escapeJson(message) << "\"";

  if (!context.empty()) {
    oss << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : context) {
      if (!first)
        oss << ",";
      oss << "\"" << escapeJson(key) << "\":\"" << escapeJson(value) << "\"";
      first = false;
    }
    oss << "}";
  }

  oss << "}";
  return oss.str();
}

std::string Logger::escapeJson(const std::string &str) {
  std::string result;
  result.reserve(str.length() + 20);

  for (char c : str) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        std::ostringstream oss;
        oss << "\\u" << std::setfill('0') << std::setw(4) << std::hex
            << static_cast<int>(c);
        result += oss.str();
      } else {
        result += c;
      }
      break;
    }
  }

  return result;
}

// Caller holds fileMutex_
void Logger::openLogFile(const std::string &filename) {
  currentLogFile_ = filename;

  std::filesystem::path logPath(filename);
  std::error_code ec;
  if (logPath.has_parent_path()) {
    std::filesystem::create_directories(logPath.parent_path(), ec);
  }

  fileStream_.open(currentLogFile_, std::ios::app);
  if (!fileStream_.is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.fileOutput = false;
    return;
  }

  currentFileSize_ = std::filesystem::exists(currentLogFile_, ec)
                         ? std::filesystem::file_size(currentLogFile_, ec)
                         : 0;
}

void Logger::writeLog(const std::string &formattedMessage) {
  bool consoleOutput;
  bool fileOutput;
  bool rotate;
  size_t maxFileSize;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    consoleOutput = config_.consoleOutput;
    fileOutput = config_.fileOutput;
    rotate = config_.enableRotation;
    maxFileSize = config_.maxFileSize;
  }

  if (consoleOutput) {
    std::lock_guard<std::mutex> lock(consoleMutex_);
    std::cout << formattedMessage << std::endl;
  }

  if (fileOutput) {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
      if (rotate && currentFileSize_ + formattedMessage.length() > maxFileSize) {
        rotateLogFile();
      }

      fileStream_ << formattedMessage << std::endl;
      fileStream_.flush();
      currentFileSize_ += formattedMessage.length() + 1;
    }
  }
}

// Caller holds fileMutex_
void Logger::rotateLogFile() {
  int maxBackupFiles;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    maxBackupFiles = config_.maxBackupFiles;
  }

  fileStream_.close();

  std::error_code ec;
  for (int i = maxBackupFiles - 1; i > 0; i--) {
    std::string oldFile = currentLogFile_ + "." + std::to_string(i);
    std::string newFile = currentLogFile_ + "." + std::to_string(i + 1);

    if (std::filesystem::exists(oldFile, ec)) {
      if (i == maxBackupFiles - 1) {
        std::filesystem::remove(newFile, ec);
      }
      std::filesystem::rename(oldFile, newFile, ec);
    }
  }

  if (maxBackupFiles > 0 && std::filesystem::exists(currentLogFile_, ec)) {
    std::filesystem::rename(currentLogFile_, currentLogFile_ + ".1", ec);
  }

  fileStream_.open(currentLogFile_, std::ios::out | std::ios::trunc);
  currentFileSize_ = 0;
}
