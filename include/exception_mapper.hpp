#pragma once

#include "accounts_exceptions.hpp"
#include <boost/beast/http.hpp>
#include <string>
#include <unordered_map>

namespace accounts {

using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body>;

// Standard error response format
struct ErrorResponseFormat {
  std::string status = "error";
  std::string message;
  std::string code;
  std::string correlationId;
  std::string timestamp;
  std::unordered_map<std::string, std::string> context;
  std::string details;

  std::string toJson() const;
};

struct ExceptionMappingConfig {
  // Status for exceptions whose code has no explicit mapping
  boost::beast::http::status defaultStatus =
      boost::beast::http::status::internal_server_error;

  // Include toLogString() output in the response body
  bool includeInternalDetails = false;

  std::string serverHeader = "Accounts API";
  std::string corsOrigin = "*";
  bool keepAlive = false;
};

/**
 * @brief Converts exceptions raised while handling a request into HTTP
 * responses with a JSON error body, logging each one at a level matching its
 * error code.
 */
class ExceptionMapper {
public:
  explicit ExceptionMapper(
      const ExceptionMappingConfig &config = ExceptionMappingConfig{});

  ExceptionMapper(const ExceptionMapper &) = delete;
  ExceptionMapper &operator=(const ExceptionMapper &) = delete;

  HttpResponse mapToResponse(const AccountsException &exception,
                             const std::string &operationName = "") const;

  // Wraps a non-domain exception as INTERNAL_ERROR
  HttpResponse mapToResponse(const std::exception &exception,
                             const std::string &operationName = "") const;

  const ExceptionMappingConfig &getConfig() const { return config_; }

  ErrorResponseFormat createErrorFormat(const AccountsException &exception) const;

  void logException(const AccountsException &exception,
                    const std::string &operationName = "") const;

  static boost::beast::http::status mapErrorCodeToStatus(ErrorCode code);

private:
  ExceptionMappingConfig config_;

  HttpResponse createHttpResponse(boost::beast::http::status status,
                                  const std::string &body) const;
};

} // namespace accounts
