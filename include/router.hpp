#pragma once

#include "exception_mapper.hpp"
#include "route_table.hpp"
#include <boost/beast/http.hpp>
#include <boost/uuid/uuid.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace accounts {

// What a handler sees of a matched request
struct RequestContext {
  boost::beast::http::verb method = boost::beast::http::verb::get;
  std::string target;
  std::string path;
  std::string operationId;
  unsigned version = 11;
  bool keepAlive = false;

  std::map<std::string, std::string> pathParams;
  std::map<std::string, boost::uuids::uuid> uuidParams;

  // Throws ValidationException(MISSING_FIELD) when the capture is absent
  const boost::uuids::uuid &uuidParam(const std::string &name) const;
  const std::string &pathParam(const std::string &name) const;
};

using RouteHandler = std::function<HttpResponse(const RequestContext &)>;

/**
 * @brief Method and path dispatch over a RouteTable.
 *
 * Patterns are split on '/', and a `{name}` segment captures exactly one
 * non-empty path segment. Query strings are ignored. Immutable once every
 * handler is bound, so one instance serves all server threads.
 */
class Router {
public:
  explicit Router(const RouteTable &table);

  // Throws ValidationException when operationId is not in the table
  Router &bind(const std::string &operationId, RouteHandler handler);

  // Operation ids from the table that have no handler yet
  std::vector<std::string> unboundOperations() const;

  /**
   * Match and invoke the handler.
   *
   * @throws NotFoundException ROUTE_NOT_FOUND when no pattern matches the path
   * @throws NotFoundException METHOD_NOT_ALLOWED when the path matches only
   *         routes of other methods; context key "allow" lists them
   * @throws ValidationException INVALID_FORMAT when a typed capture does not
   *         parse
   */
  HttpResponse dispatch(boost::beast::http::verb method,
                        std::string_view target, unsigned version,
                        bool keepAlive) const;

  // Match without invoking; same exceptions as dispatch()
  RequestContext match(boost::beast::http::verb method,
                       std::string_view target) const;

  static std::vector<std::string> splitPath(std::string_view path);
  static std::string percentDecode(std::string_view text);

private:
  struct Segment {
    std::string literal;
    std::string capture; // empty for literal segments
  };

  struct CompiledRoute {
    boost::beast::http::verb method;
    std::string pattern;
    std::string operationId;
    std::vector<Segment> segments;
    std::vector<PathCapture> captures;
    RouteHandler handler;
  };

  std::vector<CompiledRoute> routes_;

  static std::vector<Segment> compilePattern(const std::string &pattern);
  static bool matchSegments(const CompiledRoute &route,
                            const std::vector<std::string> &parts,
                            std::map<std::string, std::string> &captured);
  const CompiledRoute *findRoute(boost::beast::http::verb method,
                                 std::string_view target,
                                 RequestContext &context) const;
};

} // namespace accounts
