#pragma once

#include <boost/beast/http/verb.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace accounts {

// How the router converts a {capture} before the handler runs
enum class CaptureKind { STRING, UUID };

struct PathCapture {
  std::string name;
  CaptureKind kind = CaptureKind::STRING;
};

// A parameter as published in the API description
struct ParameterDescriptor {
  std::string name;
  std::string location = "path";
  std::string type = "string";
  std::string format;
  std::string description;
  bool required = true;
};

struct ResponseDescriptor {
  int status = 200;
  std::string description;
  std::string contentType = "application/json";
  std::string schemaRef; // empty when the body has no schema
};

/**
 * @brief One served route and its published documentation.
 *
 * `pattern` is what the router matches. `documentedPath` is the path key
 * written to the API description and may differ from `pattern`.
 */
struct RouteDescriptor {
  boost::beast::http::verb method = boost::beast::http::verb::get;
  std::string pattern;
  std::vector<PathCapture> captures;
  std::string operationId;

  bool documented = true;
  std::string documentedPath;
  std::string summary;
  std::string description;
  std::vector<std::string> tags;
  std::vector<ParameterDescriptor> parameters;
  std::vector<ResponseDescriptor> responses;
};

struct SchemaField {
  std::string name;
  std::string type;
  std::string format;
  nlohmann::json example;
  std::string description;
  bool required = true;
};

struct SchemaDescription {
  std::string name;
  std::string title;
  std::string description;
  std::vector<SchemaField> fields;
};

struct ApiInfo {
  std::string title = "API";
  std::string version = "0.1.0";
  std::string description;
};

/**
 * @brief Route and schema metadata shared by the router and the
 * documentation renderer. Built once at startup, read-only afterwards.
 */
class RouteTable {
public:
  explicit RouteTable(ApiInfo info = ApiInfo{});

  // Throws ValidationException on a duplicate operationId or an empty pattern
  RouteTable &addRoute(RouteDescriptor route);
  // Throws ValidationException on a duplicate schema name
  RouteTable &addSchema(SchemaDescription schema);

  const ApiInfo &info() const { return info_; }
  const std::vector<RouteDescriptor> &routes() const { return routes_; }
  const std::vector<SchemaDescription> &schemas() const { return schemas_; }

  const RouteDescriptor *findRoute(const std::string &operationId) const;
  const SchemaDescription *findSchema(const std::string &name) const;

private:
  ApiInfo info_;
  std::vector<RouteDescriptor> routes_;
  std::vector<SchemaDescription> schemas_;
};

namespace operations {
inline constexpr const char *GET_USER_BY_ID = "get_user_by_id";
inline constexpr const char *API_REFERENCE = "api_reference";
inline constexpr const char *API_DESCRIPTION = "api_description";
} // namespace operations

SchemaDescription userSchemaDescription();

// The service's routes: user lookup plus the documentation endpoints
RouteTable buildRouteTable(const ApiInfo &info = ApiInfo{});

} // namespace accounts
