#pragma once

#include <boost/beast/http.hpp>
#include <string>

namespace accounts {

namespace http = boost::beast::http;

/**
 * @brief Fluent HTTP response builder.
 *
 * Holds per-response state, so build one per request. The terminal methods
 * success and text produce the response and reset the status and content
 * type. Error envelopes are rendered by ExceptionMapper.
 */
class ResponseBuilder {
public:
  enum class ContentType { JSON, HTML, TEXT };

  struct ResponseConfig {
    std::string serverName = "Accounts API";
    bool enableCors = true;
    std::string corsAllowOrigin = "*";
    bool includeSecurityHeaders = true;
  };

  explicit ResponseBuilder(ResponseConfig config);

  ResponseBuilder &setKeepAlive(bool keepAlive);
  ResponseBuilder &setVersion(unsigned version);

  // Body sent as-is with the given content type
  http::response<http::string_body> success(const std::string &data,
                                            ContentType type);
  // Body sent as-is with the current status and the text/plain type
  http::response<http::string_body> text(http::status status,
                                         const std::string &body);

  const ResponseConfig &getConfig() const { return config_; }

  static std::string contentTypeToString(ContentType type);

private:
  ResponseConfig config_;

  http::status currentStatus_ = http::status::ok;
  ContentType currentContentType_ = ContentType::JSON;
  bool currentKeepAlive_ = false;
  unsigned currentVersion_ = 11;

  http::response<http::string_body> buildResponse(const std::string &body);
  void applySecurityHeaders(http::response<http::string_body> &response) const;
  void resetState();
};

} // namespace accounts
