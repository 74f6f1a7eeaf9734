#include "request_handler.hpp"
#include "accounts_exceptions.hpp"
#include "logger.hpp"

namespace accounts {

namespace {

ResponseBuilder::ResponseConfig responseConfigFor(const ServerConfig &config) {
  ResponseBuilder::ResponseConfig responseConfig;
  responseConfig.serverName = config.serverName;
  return responseConfig;
}

} // namespace

ExceptionMappingConfig
RequestHandler::mappingConfigFor(const ServerConfig &config) {
  ExceptionMappingConfig mapping;
  mapping.serverHeader = config.serverName;
  mapping.corsOrigin = "*";
  mapping.includeInternalDetails = false;
  return mapping;
}

RequestHandler::RequestHandler(const RouteTable &routes,
                               const ServerConfig &serverConfig,
                               const DocsConfig &docsConfig)
    : responseConfig_(responseConfigFor(serverConfig)),
      exceptionMapper_(mappingConfigFor(serverConfig)),
      userHandler_(responseConfig_),
      docsHandler_(routes, docsConfig, responseConfig_), router_(routes) {
  router_.bind(operations::GET_USER_BY_ID,
               [this](const RequestContext &context) {
                 return userHandler_(context);
               });
  router_.bind(operations::API_REFERENCE,
               [this](const RequestContext &context) {
                 return docsHandler_.referencePage(context.version,
                                                   context.keepAlive);
               });
  router_.bind(operations::API_DESCRIPTION,
               [this](const RequestContext &context) {
                 return docsHandler_.apiDescription(context.version,
                                                    context.keepAlive);
               });

  for (const auto &operation : router_.unboundOperations()) {
    REQ_LOG_WARN("Route {} has no handler and will answer 500", operation);
  }
  REQ_LOG_INFO("RequestHandler created with {} routes",
               routes.routes().size());
}

template <class Body, class Allocator>
http::response<http::string_body> RequestHandler::handleRequest(
    http::request<Body, http::basic_fields<Allocator>> req) const {
  REQ_LOG_DEBUG("Received request: {} {}", std::string(req.method_string()),
                std::string(req.target()));

  http::response<http::string_body> response;
  try {
    response = router_.dispatch(req.method(),
                                std::string_view(req.target().data(),
                                                 req.target().size()),
                                req.version(),
                                req.keep_alive());
  } catch (const AccountsException &ex) {
    response = exceptionMapper_.mapToResponse(ex, "handleRequest");
    response.version(req.version());
    response.keep_alive(req.keep_alive());
  } catch (const std::exception &ex) {
    response = exceptionMapper_.mapToResponse(ex, "handleRequest");
    response.version(req.version());
    response.keep_alive(req.keep_alive());
  }

  REQ_LOG_DEBUG("Responded {} to {} {}", response.result_int(),
                std::string(req.method_string()), std::string(req.target()));
  return response;
}

template http::response<http::string_body>
RequestHandler::handleRequest<http::string_body, std::allocator<char>>(
    http::request<http::string_body, http::basic_fields<std::allocator<char>>>
        req) const;

} // namespace accounts
