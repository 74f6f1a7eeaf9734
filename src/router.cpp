#include "router.hpp"
#include "accounts_exceptions.hpp"
#include "logger.hpp"
#include "user.hpp"
#include <algorithm>
#include <cctype>

namespace accounts {

namespace http = boost::beast::http;

const boost::uuids::uuid &
RequestContext::uuidParam(const std::string &name) const {
  auto it = uuidParams.find(name);
  if (it == uuidParams.end()) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "Missing path parameter", name);
  }
  return it->second;
}

const std::string &RequestContext::pathParam(const std::string &name) const {
  auto it = pathParams.find(name);
  if (it == pathParams.end()) {
    throw ValidationException(ErrorCode::MISSING_FIELD,
                              "Missing path parameter", name);
  }
  return it->second;
}

Router::Router(const RouteTable &table) {
  for (const auto &route : table.routes()) {
    CompiledRoute compiled{route.method, route.pattern, route.operationId,
                           compilePattern(route.pattern), route.captures,
                           nullptr};
    routes_.push_back(std::move(compiled));
    ROUTER_LOG_DEBUG("Registered route {} {} -> {}",
                     std::string(http::to_string(route.method)), route.pattern,
                     route.operationId);
  }
}

Router &Router::bind(const std::string &operationId, RouteHandler handler) {
  auto it = std::find_if(routes_.begin(), routes_.end(),
                         [&](const CompiledRoute &route) {
                           return route.operationId == operationId;
                         });
  if (it == routes_.end()) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "No route for operation", "operationId",
                              operationId);
  }
  it->handler = std::move(handler);
  return *this;
}

std::vector<std::string> Router::unboundOperations() const {
  std::vector<std::string> unbound;
  for (const auto &route : routes_) {
    if (!route.handler) {
      unbound.push_back(route.operationId);
    }
  }
  return unbound;
}

std::vector<Router::Segment>
Router::compilePattern(const std::string &pattern) {
  std::vector<Segment> segments;
  for (auto &part : splitPath(pattern)) {
    Segment segment;
    if (part.size() > 2 && part.front() == '{' && part.back() == '}') {
      segment.capture = part.substr(1, part.size() - 2);
    } else {
      segment.literal = std::move(part);
    }
    segments.push_back(std::move(segment));
  }
  return segments;
}

std::vector<std::string> Router::splitPath(std::string_view path) {
  std::vector<std::string> parts;
  if (path.empty()) {
    return parts;
  }
  if (path.front() == '/') {
    path.remove_prefix(1);
  }

  size_t start = 0;
  while (true) {
    size_t slash = path.find('/', start);
    if (slash == std::string_view::npos) {
      parts.emplace_back(path.substr(start));
      break;
    }
    parts.emplace_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return parts;
}

std::string Router::percentDecode(std::string_view text) {
  auto hexValue = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      decoded += text[i];
      continue;
    }
    if (i + 2 >= text.size() || hexValue(text[i + 1]) < 0 ||
        hexValue(text[i + 2]) < 0) {
      throw ValidationException(ErrorCode::INVALID_FORMAT,
                                "Invalid percent-encoding in path", "path",
                                std::string(text));
    }
    decoded += static_cast<char>(hexValue(text[i + 1]) * 16 +
                                 hexValue(text[i + 2]));
    i += 2;
  }
  return decoded;
}

bool Router::matchSegments(const CompiledRoute &route,
                           const std::vector<std::string> &parts,
                           std::map<std::string, std::string> &captured) {
  if (parts.size() != route.segments.size()) {
    return false;
  }

  std::map<std::string, std::string> values;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto &segment = route.segments[i];
    if (segment.capture.empty()) {
      if (segment.literal != parts[i])
        return false;
    } else {
      if (parts[i].empty())
        return false;
      values[segment.capture] = parts[i];
    }
  }
  captured = std::move(values);
  return true;
}

const Router::CompiledRoute *Router::findRoute(http::verb method,
                                               std::string_view target,
                                               RequestContext &context) const {
  std::string_view path = target.substr(0, target.find('?'));
  context.method = method;
  context.target = std::string(target);
  context.path = std::string(path);

  if (path.empty() || path.front() != '/') {
    throw NotFoundException(ErrorCode::ROUTE_NOT_FOUND, "Route not found",
                            context.path);
  }

  auto parts = splitPath(path);
  std::vector<std::string> allowed;

  for (const auto &route : routes_) {
    std::map<std::string, std::string> captured;
    if (!matchSegments(route, parts, captured)) {
      continue;
    }
    if (route.method != method) {
      std::string name(http::to_string(route.method));
      if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
        allowed.push_back(std::move(name));
      }
      continue;
    }

    context.operationId = route.operationId;
    for (const auto &[name, raw] : captured) {
      context.pathParams[name] = percentDecode(raw);
    }
    return &route;
  }

  if (!allowed.empty()) {
    std::string allow;
    for (const auto &name : allowed) {
      if (!allow.empty())
        allow += ", ";
      allow += name;
    }
    NotFoundException ex(ErrorCode::METHOD_NOT_ALLOWED, "Method not allowed",
                         context.path);
    ex.addContext("allow", allow);
    ex.addContext("method", std::string(http::to_string(method)));
    throw ex;
  }

  throw NotFoundException(ErrorCode::ROUTE_NOT_FOUND, "Route not found",
                          context.path);
}

RequestContext Router::match(http::verb method, std::string_view target) const {
  RequestContext context;
  const CompiledRoute *route = findRoute(method, target, context);

  for (const auto &capture : route->captures) {
    if (capture.kind != CaptureKind::UUID) {
      continue;
    }
    const std::string &raw = context.pathParam(capture.name);
    auto uuid = parseCanonicalUuid(raw);
    if (!uuid) {
      throw ValidationException(ErrorCode::INVALID_FORMAT,
                                "Cannot parse `" + capture.name +
                                    "` as a UUID",
                                capture.name, raw);
    }
    context.uuidParams[capture.name] = *uuid;
  }

  ROUTER_LOG_DEBUG("Matched {} -> {}", context.path, context.operationId);
  return context;
}

HttpResponse Router::dispatch(http::verb method, std::string_view target,
                              unsigned version, bool keepAlive) const {
  RequestContext context = match(method, target);
  context.version = version;
  context.keepAlive = keepAlive;

  auto it = std::find_if(routes_.begin(), routes_.end(),
                         [&](const CompiledRoute &route) {
                           return route.operationId == context.operationId;
                         });
  if (it == routes_.end() || !it->handler) {
    throw SystemException(ErrorCode::INTERNAL_ERROR,
                          "No handler bound for operation", "Router",
                          {{"operationId", context.operationId}});
  }
  return it->handler(context);
}

} // namespace accounts
