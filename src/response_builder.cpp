#include "response_builder.hpp"

namespace accounts {

ResponseBuilder::ResponseBuilder(ResponseConfig config)
    : config_(std::move(config)) {
  resetState();
}

ResponseBuilder &ResponseBuilder::setKeepAlive(bool keepAlive) {
  currentKeepAlive_ = keepAlive;
  return *this;
}

ResponseBuilder &ResponseBuilder::setVersion(unsigned version) {
  currentVersion_ = version;
  return *this;
}

http::response<http::string_body>
ResponseBuilder::success(const std::string &data, ContentType type) {
  currentStatus_ = http::status::ok;
  currentContentType_ = type;
  return buildResponse(data);
}

http::response<http::string_body>
ResponseBuilder::text(http::status status, const std::string &body) {
  currentStatus_ = status;
  currentContentType_ = ContentType::TEXT;
  return buildResponse(body);
}

http::response<http::string_body>
ResponseBuilder::buildResponse(const std::string &body) {
  http::response<http::string_body> response{currentStatus_, currentVersion_};

  response.body() = body;
  response.set(http::field::server, config_.serverName);
  response.set(http::field::content_type,
               contentTypeToString(currentContentType_));

  if (config_.enableCors) {
    response.set(http::field::access_control_allow_origin,
                 config_.corsAllowOrigin);
  }

  if (config_.includeSecurityHeaders) {
    applySecurityHeaders(response);
  }

  response.keep_alive(currentKeepAlive_);
  response.prepare_payload();

  resetState();
  return response;
}

void ResponseBuilder::applySecurityHeaders(
    http::response<http::string_body> &response) const {
  response.set("x-content-type-options", "nosniff");
  response.set("referrer-policy", "strict-origin-when-cross-origin");

  // HTML stays frameable for the reference viewer
  if (currentContentType_ != ContentType::HTML) {
    response.set("x-frame-options", "DENY");
  }
}

void ResponseBuilder::resetState() {
  currentStatus_ = http::status::ok;
  currentContentType_ = ContentType::JSON;
  // Keep-alive and version follow the request and survive a terminal call
}

std::string ResponseBuilder::contentTypeToString(ContentType type) {
  switch (type) {
  case ContentType::JSON:
    return "application/json";
  case ContentType::HTML:
    return "text/html; charset=utf-8";
  case ContentType::TEXT:
    return "text/plain; charset=utf-8";
  }
  return "application/json";
}

} // namespace accounts
