#include "exception_mapper.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace accounts;
namespace beast_http = boost::beast::http;

class ExceptionMapperTest : public ::testing::Test {
protected:
  ExceptionMapper mapper_;
};

TEST_F(ExceptionMapperTest, ValidationErrorsMapToBadRequest) {
  ValidationException ex(ErrorCode::INVALID_FORMAT,
                         "Cannot parse `userId` as a UUID", "userId",
                         "not-a-uuid");
  auto response = mapper_.mapToResponse(ex, "test_validation");

  EXPECT_EQ(response.result(), beast_http::status::bad_request);
  EXPECT_EQ(response[beast_http::field::content_type], "application/json");

  auto body = nlohmann::json::parse(response.body());
  EXPECT_EQ(body["status"], "error");
  EXPECT_EQ(body["code"], "INVALID_FORMAT");
  EXPECT_EQ(body["message"], "Cannot parse `userId` as a UUID");
  EXPECT_EQ(body["correlationId"], ex.getCorrelationId());
  EXPECT_EQ(body["context"]["field"], "userId");
  EXPECT_FALSE(body.contains("details"));
}

TEST_F(ExceptionMapperTest, RouteNotFoundMapsTo404) {
  NotFoundException ex(ErrorCode::ROUTE_NOT_FOUND, "Route not found", "/x");
  auto response = mapper_.mapToResponse(ex);
  EXPECT_EQ(response.result(), beast_http::status::not_found);
}

TEST_F(ExceptionMapperTest, MethodNotAllowedSetsAllowHeader) {
  NotFoundException ex(ErrorCode::METHOD_NOT_ALLOWED, "Method not allowed",
                       "/api");
  ex.addContext("allow", "GET");
  auto response = mapper_.mapToResponse(ex);

  EXPECT_EQ(response.result(), beast_http::status::method_not_allowed);
  EXPECT_EQ(response[beast_http::field::allow], "GET");
}

TEST_F(ExceptionMapperTest, SystemErrorsMapTo500) {
  SystemException ex(ErrorCode::SERIALIZATION_ERROR, "encoder failed",
                     "UserHandler");
  auto response = mapper_.mapToResponse(ex);
  EXPECT_EQ(response.result(), beast_http::status::internal_server_error);
}

TEST_F(ExceptionMapperTest, StandardExceptionsBecomeInternalError) {
  std::runtime_error ex("boom");
  auto response = mapper_.mapToResponse(ex, "test_std");

  EXPECT_EQ(response.result(), beast_http::status::internal_server_error);
  auto body = nlohmann::json::parse(response.body());
  EXPECT_EQ(body["code"], "INTERNAL_ERROR");
  EXPECT_NE(body["message"].get<std::string>().find("boom"),
            std::string::npos);
}

TEST_F(ExceptionMapperTest, StatusTable) {
  EXPECT_EQ(ExceptionMapper::mapErrorCodeToStatus(ErrorCode::INVALID_INPUT),
            beast_http::status::bad_request);
  EXPECT_EQ(ExceptionMapper::mapErrorCodeToStatus(ErrorCode::MISSING_FIELD),
            beast_http::status::bad_request);
  EXPECT_EQ(
      ExceptionMapper::mapErrorCodeToStatus(ErrorCode::RESOURCE_NOT_FOUND),
      beast_http::status::not_found);
  EXPECT_EQ(ExceptionMapper::mapErrorCodeToStatus(ErrorCode::NETWORK_ERROR),
            beast_http::status::service_unavailable);
  EXPECT_EQ(ExceptionMapper::mapErrorCodeToStatus(ErrorCode::BIND_FAILED),
            beast_http::status::internal_server_error);
}

TEST_F(ExceptionMapperTest, ConfiguredHeadersAndDetails) {
  ExceptionMappingConfig config;
  config.serverHeader = "Mapper Test";
  config.includeInternalDetails = true;
  config.keepAlive = true;
  ExceptionMapper mapper(config);

  SystemException ex(ErrorCode::INTERNAL_ERROR, "oops", "Test");
  auto response = mapper.mapToResponse(ex);

  EXPECT_EQ(response[beast_http::field::server], "Mapper Test");
  EXPECT_EQ(response[beast_http::field::access_control_allow_origin], "*");
  EXPECT_TRUE(response.keep_alive());
  auto body = nlohmann::json::parse(response.body());
  EXPECT_NE(body["details"].get<std::string>().find("[SYSTEM]"),
            std::string::npos);
}

TEST(ErrorResponseFormatTest, OmitsEmptyOptionalFields) {
  ErrorResponseFormat format;
  format.message = "m";
  format.code = "C";
  format.correlationId = "12345678";
  format.timestamp = "2024-01-01T00:00:00Z";

  auto json = nlohmann::json::parse(format.toJson());
  EXPECT_EQ(json["status"], "error");
  EXPECT_FALSE(json.contains("context"));
  EXPECT_FALSE(json.contains("details"));
}
