#pragma once

#include "logger.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace accounts {

template <typename Component> struct ComponentTrait;

template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class HttpServer> {
  static constexpr const char *name = "HttpServer";
};

template <> struct ComponentTrait<class HttpSession> {
  static constexpr const char *name = "HttpSession";
};

template <> struct ComponentTrait<class Router> {
  static constexpr const char *name = "Router";
};

template <> struct ComponentTrait<class RequestHandler> {
  static constexpr const char *name = "RequestHandler";
};

template <> struct ComponentTrait<class DocsHandler> {
  static constexpr const char *name = "DocsHandler";
};

template <> struct ComponentTrait<class ExceptionMapper> {
  static constexpr const char *name = "ExceptionMapper";
};

/**
 * ComponentLogger - compile-time component names for Logger calls.
 *
 * Messages use `{}` placeholders filled in order by the trailing arguments.
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().debug(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().debug(component_name, message);
    }
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().info(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().info(component_name, message);
    }
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().warn(component_name,
                       format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().warn(component_name, message);
    }
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().error(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().error(component_name, message);
    }
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    if constexpr (sizeof...(args) > 0) {
      getLogger().fatal(component_name,
                        format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().fatal(component_name, message);
    }
  }

  static void infoWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().info(component_name, message, context);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

private:
  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<T>> ||
                  std::is_convertible_v<T, std::string>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

using ConfigLogger = ComponentLogger<class ConfigManager>;
using HttpLogger = ComponentLogger<class HttpServer>;
using SessionLogger = ComponentLogger<class HttpSession>;
using RouterLogger = ComponentLogger<class Router>;
using RequestLogger = ComponentLogger<class RequestHandler>;
using DocsLogger = ComponentLogger<class DocsHandler>;
using ExceptionLogger = ComponentLogger<class ExceptionMapper>;

} // namespace accounts

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  accounts::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  accounts::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  accounts::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  accounts::ConfigLogger::error(message, ##__VA_ARGS__)

#define HTTP_LOG_DEBUG(message, ...)                                           \
  accounts::HttpLogger::debug(message, ##__VA_ARGS__)
#define HTTP_LOG_INFO(message, ...)                                            \
  accounts::HttpLogger::info(message, ##__VA_ARGS__)
#define HTTP_LOG_WARN(message, ...)                                            \
  accounts::HttpLogger::warn(message, ##__VA_ARGS__)
#define HTTP_LOG_ERROR(message, ...)                                           \
  accounts::HttpLogger::error(message, ##__VA_ARGS__)
#define HTTP_LOG_FATAL(message, ...)                                           \
  accounts::HttpLogger::fatal(message, ##__VA_ARGS__)

#define SESSION_LOG_DEBUG(message, ...)                                        \
  accounts::SessionLogger::debug(message, ##__VA_ARGS__)
#define SESSION_LOG_WARN(message, ...)                                         \
  accounts::SessionLogger::warn(message, ##__VA_ARGS__)
#define SESSION_LOG_ERROR(message, ...)                                        \
  accounts::SessionLogger::error(message, ##__VA_ARGS__)

#define ROUTER_LOG_DEBUG(message, ...)                                         \
  accounts::RouterLogger::debug(message, ##__VA_ARGS__)
#define ROUTER_LOG_INFO(message, ...)                                          \
  accounts::RouterLogger::info(message, ##__VA_ARGS__)
#define ROUTER_LOG_WARN(message, ...)                                          \
  accounts::RouterLogger::warn(message, ##__VA_ARGS__)

#define REQ_LOG_DEBUG(message, ...)                                            \
  accounts::RequestLogger::debug(message, ##__VA_ARGS__)
#define REQ_LOG_INFO(message, ...)                                             \
  accounts::RequestLogger::info(message, ##__VA_ARGS__)
#define REQ_LOG_WARN(message, ...)                                             \
  accounts::RequestLogger::warn(message, ##__VA_ARGS__)
#define REQ_LOG_ERROR(message, ...)                                            \
  accounts::RequestLogger::error(message, ##__VA_ARGS__)

#define DOCS_LOG_DEBUG(message, ...)                                           \
  accounts::DocsLogger::debug(message, ##__VA_ARGS__)
#define DOCS_LOG_INFO(message, ...)                                            \
  accounts::DocsLogger::info(message, ##__VA_ARGS__)
