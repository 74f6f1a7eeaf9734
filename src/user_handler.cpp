#include "user_handler.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

namespace accounts {

UserHandler::UserHandler(ResponseBuilder::ResponseConfig responseConfig,
                         UserSerializer serializer)
    : responseConfig_(std::move(responseConfig)),
      serializer_(std::move(serializer)) {}

UserSerializer UserHandler::defaultSerializer() {
  return [](const User &user) { return nlohmann::json(user).dump(); };
}

User UserHandler::lookupUser(const boost::uuids::uuid &userId) {
  User user;
  user.uuid = userId;
  user.firstName = "Jane";
  user.lastName = "Doe";
  user.email = "jane.doe@example.com";
  user.enabled = true;
  user.activated = true;
  return user;
}

HttpResponse UserHandler::getUserById(const boost::uuids::uuid &userId,
                                      unsigned version, bool keepAlive) const {
  ResponseBuilder builder(responseConfig_);
  builder.setVersion(version).setKeepAlive(keepAlive);

  if (userId.is_nil()) {
    return builder.text(http::status::not_found, "User not found");
  }

  std::string body;
  try {
    body = serializer_(lookupUser(userId));
  } catch (const std::exception &ex) {
    LOG_ERROR("UserHandler",
              std::string("User serialization failed: ") + ex.what());
    return builder.text(http::status::internal_server_error, "Unknown error");
  }

  return builder.success(body, ResponseBuilder::ContentType::JSON);
}

HttpResponse UserHandler::operator()(const RequestContext &context) const {
  return getUserById(context.uuidParam("userId"), context.version,
                     context.keepAlive);
}

} // namespace accounts
