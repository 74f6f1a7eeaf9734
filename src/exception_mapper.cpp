#include "exception_mapper.hpp"
#include "logger.hpp"
#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <typeinfo>

namespace accounts {

namespace http = boost::beast::http;

std::string ErrorResponseFormat::toJson() const {
  nlohmann::json json = {{"status", status},
                         {"message", message},
                         {"code", code},
                         {"correlationId", correlationId},
                         {"timestamp", timestamp}};

  if (!context.empty()) {
    json["context"] = context;
  }
  if (!details.empty()) {
    json["details"] = details;
  }
  return json.dump();
}

ExceptionMapper::ExceptionMapper(const ExceptionMappingConfig &config)
    : config_(config) {}

HttpResponse
ExceptionMapper::mapToResponse(const AccountsException &exception,
                               const std::string &operationName) const {
  logException(exception, operationName);

  auto status = mapErrorCodeToStatus(exception.getCode());
  if (status == http::status::unknown) {
    status = config_.defaultStatus;
  }

  auto response = createHttpResponse(status, createErrorFormat(exception).toJson());

  if (exception.getCode() == ErrorCode::METHOD_NOT_ALLOWED) {
    auto it = exception.getContext().find("allow");
    if (it != exception.getContext().end()) {
      response.set(http::field::allow, it->second);
    }
  }
  return response;
}

HttpResponse
ExceptionMapper::mapToResponse(const std::exception &exception,
                               const std::string &operationName) const {
  SystemException wrapped(
      ErrorCode::INTERNAL_ERROR,
      "Standard exception: " + std::string(exception.what()), "ExceptionMapper",
      ErrorContext{{"original_type", typeid(exception).name()}});

  return mapToResponse(wrapped, operationName);
}

ErrorResponseFormat
ExceptionMapper::createErrorFormat(const AccountsException &exception) const {
  ErrorResponseFormat format;

  format.message = exception.getMessage();
  format.code = errorCodeToString(exception.getCode());
  format.correlationId = exception.getCorrelationId();

  auto time_t = std::chrono::system_clock::to_time_t(exception.getTimestamp());
  std::tm tm_buf{};
  std::ostringstream timestampStream;
  if (gmtime_r(&time_t, &tm_buf)) {
    timestampStream << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
  } else {
    timestampStream << "1970-01-01T00:00:00Z";
  }
  format.timestamp = timestampStream.str();

  format.context = exception.getContext();

  if (config_.includeInternalDetails) {
    format.details = exception.toLogString();
  }

  return format;
}

void ExceptionMapper::logException(const AccountsException &exception,
                                   const std::string &operationName) const {
  std::string logMessage = "Exception in operation '" + operationName +
                           "': " + exception.toLogString();

  switch (exception.getCode()) {
  case ErrorCode::INVALID_INPUT:
  case ErrorCode::INVALID_FORMAT:
  case ErrorCode::MISSING_FIELD:
  case ErrorCode::METHOD_NOT_ALLOWED:
    ExceptionLogger::warn(logMessage);
    break;

  case ErrorCode::ROUTE_NOT_FOUND:
  case ErrorCode::RESOURCE_NOT_FOUND:
    ExceptionLogger::info(logMessage);
    break;

  default:
    ExceptionLogger::error(logMessage);
    break;
  }
}

http::status ExceptionMapper::mapErrorCodeToStatus(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
  case ErrorCode::INVALID_FORMAT:
  case ErrorCode::MISSING_FIELD:
    return http::status::bad_request;

  case ErrorCode::ROUTE_NOT_FOUND:
  case ErrorCode::RESOURCE_NOT_FOUND:
    return http::status::not_found;

  case ErrorCode::METHOD_NOT_ALLOWED:
    return http::status::method_not_allowed;

  case ErrorCode::NETWORK_ERROR:
    return http::status::service_unavailable;

  case ErrorCode::SERIALIZATION_ERROR:
  case ErrorCode::CONFIGURATION_ERROR:
  case ErrorCode::BIND_FAILED:
  case ErrorCode::INTERNAL_ERROR:
    return http::status::internal_server_error;
  }
  return http::status::unknown;
}

HttpResponse ExceptionMapper::createHttpResponse(http::status status,
                                                 const std::string &body) const {
  HttpResponse response{status, 11};

  response.set(http::field::server, config_.serverHeader);
  response.set(http::field::content_type, "application/json");
  response.set(http::field::access_control_allow_origin, config_.corsOrigin);
  response.keep_alive(config_.keepAlive);

  response.body() = body;
  response.prepare_payload();

  return response;
}

} // namespace accounts
