#include "accounts_exceptions.hpp"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace accounts {

const char *getErrorCodeDescription(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "Invalid input";
  case ErrorCode::INVALID_FORMAT:
    return "Invalid format";
  case ErrorCode::MISSING_FIELD:
    return "Missing required field";
  case ErrorCode::ROUTE_NOT_FOUND:
    return "Route not found";
  case ErrorCode::METHOD_NOT_ALLOWED:
    return "Method not allowed";
  case ErrorCode::RESOURCE_NOT_FOUND:
    return "Resource not found";
  case ErrorCode::SERIALIZATION_ERROR:
    return "Serialization error";
  case ErrorCode::CONFIGURATION_ERROR:
    return "Configuration error";
  case ErrorCode::BIND_FAILED:
    return "Failed to bind listening socket";
  case ErrorCode::NETWORK_ERROR:
    return "Network error";
  case ErrorCode::INTERNAL_ERROR:
    return "Internal error";
  }
  return "Unknown error";
}

std::string errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "INVALID_INPUT";
  case ErrorCode::INVALID_FORMAT:
    return "INVALID_FORMAT";
  case ErrorCode::MISSING_FIELD:
    return "MISSING_FIELD";
  case ErrorCode::ROUTE_NOT_FOUND:
    return "ROUTE_NOT_FOUND";
  case ErrorCode::METHOD_NOT_ALLOWED:
    return "METHOD_NOT_ALLOWED";
  case ErrorCode::RESOURCE_NOT_FOUND:
    return "RESOURCE_NOT_FOUND";
  case ErrorCode::SERIALIZATION_ERROR:
    return "SERIALIZATION_ERROR";
  case ErrorCode::CONFIGURATION_ERROR:
    return "CONFIGURATION_ERROR";
  case ErrorCode::BIND_FAILED:
    return "BIND_FAILED";
  case ErrorCode::NETWORK_ERROR:
    return "NETWORK_ERROR";
  case ErrorCode::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

std::string getErrorCategory(ErrorCode code) {
  int value = static_cast<int>(code);
  if (value >= 1000 && value < 2000)
    return "validation";
  if (value >= 2000 && value < 3000)
    return "routing";
  return "system";
}

std::string AccountsException::generateCorrelationId() {
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<> dis(0, 15);

  std::stringstream ss;
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

AccountsException::AccountsException(ErrorCode code, std::string message,
                                     ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string AccountsException::toLogString() const {
  std::stringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << static_cast<int>(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string AccountsException::toJsonString() const {
  nlohmann::json json = {
      {"correlationId", correlationId_},
      {"errorCode", static_cast<int>(errorCode_)},
      {"message", message_},
      {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                        timestamp_.time_since_epoch())
                        .count()}};

  if (!context_.empty()) {
    json["context"] = context_;
  }
  return json.dump();
}

void AccountsException::addContext(const std::string &key,
                                   const std::string &value) {
  context_[key] = value;
}

void AccountsException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : AccountsException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
  if (!field_.empty()) {
    addContext("field", field_);
  }
  if (!value_.empty()) {
    addContext("value", value_);
  }
}

std::string ValidationException::toLogString() const {
  std::stringstream ss;
  ss << "[VALIDATION] " << AccountsException::toLogString();
  if (!field_.empty()) {
    ss << " Field=\"" << field_ << "\"";
  }
  return ss.str();
}

NotFoundException::NotFoundException(ErrorCode code, std::string message,
                                     std::string resource,
                                     ErrorContext context)
    : AccountsException(code, std::move(message), std::move(context)),
      resource_(std::move(resource)) {
  if (!resource_.empty()) {
    addContext("resource", resource_);
  }
}

std::string NotFoundException::toLogString() const {
  std::stringstream ss;
  ss << "[NOT_FOUND] " << AccountsException::toLogString();
  return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : AccountsException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::stringstream ss;
  ss << "[SYSTEM] " << AccountsException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason) {
  ErrorContext context;
  context["reason"] = reason;
  return ValidationException(ErrorCode::INVALID_INPUT,
                             "Validation failed: " + reason, field, value,
                             context);
}

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details) {
  ErrorContext context;
  context["details"] = details;
  return SystemException(code, getErrorCodeDescription(code), component,
                         context);
}

} // namespace accounts
