#include "route_table.hpp"
#include "accounts_exceptions.hpp"
#include <algorithm>

namespace accounts {

namespace http = boost::beast::http;

RouteTable::RouteTable(ApiInfo info) : info_(std::move(info)) {}

RouteTable &RouteTable::addRoute(RouteDescriptor route) {
  if (route.pattern.empty() || route.pattern.front() != '/') {
    throw ValidationException(ErrorCode::INVALID_FORMAT,
                              "Route pattern must start with '/'", "pattern",
                              route.pattern);
  }
  if (route.operationId.empty()) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "Route requires an operationId", "operationId",
                              "", {{"pattern", route.pattern}});
  }
  if (findRoute(route.operationId) != nullptr) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Duplicate operationId", "operationId",
                              route.operationId);
  }
  if (route.documentedPath.empty()) {
    route.documentedPath = route.pattern;
  }
  routes_.push_back(std::move(route));
  return *this;
}

RouteTable &RouteTable::addSchema(SchemaDescription schema) {
  if (findSchema(schema.name) != nullptr) {
    throw ValidationException(ErrorCode::INVALID_INPUT, "Duplicate schema",
                              "name", schema.name);
  }
  schemas_.push_back(std::move(schema));
  return *this;
}

const RouteDescriptor *
RouteTable::findRoute(const std::string &operationId) const {
  auto it = std::find_if(routes_.begin(), routes_.end(),
                         [&](const RouteDescriptor &route) {
                           return route.operationId == operationId;
                         });
  return it == routes_.end() ? nullptr : &*it;
}

const SchemaDescription *
RouteTable::findSchema(const std::string &name) const {
  auto it = std::find_if(
      schemas_.begin(), schemas_.end(),
      [&](const SchemaDescription &schema) { return schema.name == name; });
  return it == schemas_.end() ? nullptr : &*it;
}

SchemaDescription userSchemaDescription() {
  SchemaDescription schema;
  schema.name = "User";
  schema.title = "User Account";
  schema.description = "Represents a user account within the business.";
  schema.fields = {
      {"uuid", "string", "uuid", "550e8400-e29b-41d4-a716-446655440000",
       "Unique identifier for the user."},
      {"firstName", "string", "", "Jane", "First name of the user."},
      {"lastName", "string", "", "Doe", "Last name of the user."},
      {"email", "string", "", "jane.doe@example.com",
       "Email address of the user."},
      {"enabled", "boolean", "", true,
       "Whether the user's account is enabled."},
      {"activated", "boolean", "", true,
       "Whether the user's account is activated."}};
  return schema;
}

RouteTable buildRouteTable(const ApiInfo &info) {
  RouteTable table(info);

  RouteDescriptor getUser;
  getUser.method = http::verb::get;
  getUser.pattern = "/users/{userId}";
  getUser.captures = {{"userId", CaptureKind::UUID}};
  getUser.operationId = operations::GET_USER_BY_ID;
  getUser.documentedPath = "/business/{businessId}/users/{userId}";
  getUser.summary = "Get user account by user id";
  getUser.parameters = {
      {"businessId", "path", "string", "uuid", "Business id of the user", true},
      {"userId", "path", "string", "", "User id to get user", true}};
  getUser.responses = {{200, "User", "application/json", "User"}};
  table.addRoute(std::move(getUser));

  RouteDescriptor reference;
  reference.method = http::verb::get;
  reference.pattern = "/api";
  reference.operationId = operations::API_REFERENCE;
  reference.documented = false;
  table.addRoute(std::move(reference));

  RouteDescriptor description;
  description.method = http::verb::get;
  description.pattern = "/api/openapi.json";
  description.operationId = operations::API_DESCRIPTION;
  description.documented = false;
  table.addRoute(std::move(description));

  table.addSchema(userSchemaDescription());
  return table;
}

} // namespace accounts
