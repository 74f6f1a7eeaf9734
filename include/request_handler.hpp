#pragma once

#include "config_manager.hpp"
#include "docs_handler.hpp"
#include "exception_mapper.hpp"
#include "response_builder.hpp"
#include "route_table.hpp"
#include "router.hpp"
#include "server_config.hpp"
#include "user_handler.hpp"
#include <boost/beast/http.hpp>
#include <memory>

namespace accounts {

/**
 * @brief Application entry point for every HTTP request.
 *
 * Wires the route table to the user and documentation handlers, and turns
 * exceptions escaping the router into JSON error responses. Shared by all
 * sessions; holds no per-request state.
 */
class RequestHandler {
public:
  RequestHandler(const RouteTable &routes, const ServerConfig &serverConfig,
                 const DocsConfig &docsConfig);

  template <class Body, class Allocator>
  http::response<http::string_body>
  handleRequest(http::request<Body, http::basic_fields<Allocator>> req) const;

  const Router &getRouter() const { return router_; }

private:
  ResponseBuilder::ResponseConfig responseConfig_;
  ExceptionMapper exceptionMapper_;
  UserHandler userHandler_;
  DocsHandler docsHandler_;
  Router router_;

  static ExceptionMappingConfig mappingConfigFor(const ServerConfig &config);
};

} // namespace accounts
