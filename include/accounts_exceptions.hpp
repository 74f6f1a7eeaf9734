#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace accounts {

class AccountsException;
class ValidationException;
class NotFoundException;
class SystemException;

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  INVALID_FORMAT = 1001,
  MISSING_FIELD = 1002,

  // Routing errors (2000-2999)
  ROUTE_NOT_FOUND = 2000,
  METHOD_NOT_ALLOWED = 2001,
  RESOURCE_NOT_FOUND = 2002,

  // System errors (3000-3999)
  SERIALIZATION_ERROR = 3000,
  CONFIGURATION_ERROR = 3001,
  BIND_FAILED = 3002,
  NETWORK_ERROR = 3003,
  INTERNAL_ERROR = 3004
};

using ErrorContext = std::unordered_map<std::string, std::string>;

const char *getErrorCodeDescription(ErrorCode code);
std::string errorCodeToString(ErrorCode code);
std::string getErrorCategory(ErrorCode code);

// Base exception with error context and correlation ID support
class AccountsException : public std::exception {
public:
  AccountsException(ErrorCode code, std::string message,
                    ErrorContext context = {});

  AccountsException(const AccountsException &other) = default;
  AccountsException &operator=(const AccountsException &other) = default;
  AccountsException(AccountsException &&other) noexcept = default;
  AccountsException &operator=(AccountsException &&other) noexcept = default;

  virtual ~AccountsException() = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Malformed or missing request input
class ValidationException : public AccountsException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// Unknown route, wrong method or missing resource
class NotFoundException : public AccountsException {
public:
  NotFoundException(ErrorCode code, std::string message,
                    std::string resource = "", ErrorContext context = {});

  const std::string &getResource() const { return resource_; }

  std::string toLogString() const override;

private:
  std::string resource_;
};

// Infrastructure failures: sockets, configuration, serialization
class SystemException : public AccountsException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason);

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details);

} // namespace accounts
