#pragma once

#include "exception_mapper.hpp"
#include "response_builder.hpp"
#include "router.hpp"
#include "user.hpp"
#include <boost/uuid/uuid.hpp>
#include <functional>
#include <string>

namespace accounts {

using UserSerializer = std::function<std::string(const User &)>;

/**
 * @brief Serves GET /users/{userId}.
 *
 * The nil UUID is reserved and always answers 404 "User not found". Any other
 * id answers 200 with the canned account carrying that id. A serializer
 * failure answers 500 "Unknown error".
 */
class UserHandler {
public:
  explicit UserHandler(ResponseBuilder::ResponseConfig responseConfig,
                       UserSerializer serializer = defaultSerializer());

  HttpResponse getUserById(const boost::uuids::uuid &userId, unsigned version,
                           bool keepAlive) const;

  // RouteHandler adapter: reads the "userId" capture
  HttpResponse operator()(const RequestContext &context) const;

  static User lookupUser(const boost::uuids::uuid &userId);
  static UserSerializer defaultSerializer();

private:
  ResponseBuilder::ResponseConfig responseConfig_;
  UserSerializer serializer_;
};

} // namespace accounts
