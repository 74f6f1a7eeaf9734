#include "accounts_exceptions.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace accounts;

TEST(AccountsExceptionTest, CarriesCodeMessageAndContext) {
  AccountsException ex(ErrorCode::INVALID_INPUT, "bad input",
                       {{"key", "value"}});

  EXPECT_EQ(ex.getCode(), ErrorCode::INVALID_INPUT);
  EXPECT_EQ(ex.getMessage(), "bad input");
  EXPECT_STREQ(ex.what(), "bad input");
  EXPECT_EQ(ex.getContext().at("key"), "value");
  EXPECT_EQ(ex.getCorrelationId().size(), 8u);
}

TEST(AccountsExceptionTest, CorrelationIdsDiffer) {
  AccountsException first(ErrorCode::INTERNAL_ERROR, "a");
  AccountsException second(ErrorCode::INTERNAL_ERROR, "b");
  EXPECT_NE(first.getCorrelationId(), second.getCorrelationId());

  second.setCorrelationId("deadbeef");
  EXPECT_EQ(second.getCorrelationId(), "deadbeef");
}

TEST(AccountsExceptionTest, LogStringIncludesCodeAndContext) {
  AccountsException ex(ErrorCode::ROUTE_NOT_FOUND, "Route not found");
  ex.addContext("resource", "/nowhere");

  std::string log = ex.toLogString();
  EXPECT_NE(log.find("ErrorCode=2000"), std::string::npos);
  EXPECT_NE(log.find("Message=\"Route not found\""), std::string::npos);
  EXPECT_NE(log.find("resource=\"/nowhere\""), std::string::npos);
}

TEST(AccountsExceptionTest, JsonStringIsParseable) {
  AccountsException ex(ErrorCode::BIND_FAILED, "bind failed",
                       {{"port", "8080"}});
  auto json = nlohmann::json::parse(ex.toJsonString());

  EXPECT_EQ(json["errorCode"], 3002);
  EXPECT_EQ(json["message"], "bind failed");
  EXPECT_EQ(json["context"]["port"], "8080");
  EXPECT_EQ(json["correlationId"], ex.getCorrelationId());
}

TEST(AccountsExceptionTest, SubclassesRecordTheirSubject) {
  ValidationException validation(ErrorCode::INVALID_FORMAT, "bad uuid",
                                 "userId", "xyz");
  EXPECT_EQ(validation.getField(), "userId");
  EXPECT_EQ(validation.getValue(), "xyz");
  EXPECT_EQ(validation.getContext().at("field"), "userId");
  EXPECT_NE(validation.toLogString().find("[VALIDATION]"), std::string::npos);

  NotFoundException notFound(ErrorCode::ROUTE_NOT_FOUND, "missing", "/x");
  EXPECT_EQ(notFound.getResource(), "/x");
  EXPECT_EQ(notFound.getContext().at("resource"), "/x");
  EXPECT_NE(notFound.toLogString().find("[NOT_FOUND]"), std::string::npos);

  SystemException system(ErrorCode::BIND_FAILED, "in use", "HttpServer");
  EXPECT_EQ(system.getComponent(), "HttpServer");
  EXPECT_EQ(system.getContext().at("component"), "HttpServer");
  EXPECT_NE(system.toLogString().find("Component=\"HttpServer\""),
            std::string::npos);
}

TEST(AccountsExceptionTest, SubclassesAreCatchableAsBase) {
  try {
    throw ValidationException(ErrorCode::MISSING_FIELD, "missing");
  } catch (const AccountsException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::MISSING_FIELD);
  }
}

TEST(ErrorCodeTest, CategoriesFollowRanges) {
  EXPECT_EQ(getErrorCategory(ErrorCode::INVALID_INPUT), "validation");
  EXPECT_EQ(getErrorCategory(ErrorCode::MISSING_FIELD), "validation");
  EXPECT_EQ(getErrorCategory(ErrorCode::ROUTE_NOT_FOUND), "routing");
  EXPECT_EQ(getErrorCategory(ErrorCode::RESOURCE_NOT_FOUND), "routing");
  EXPECT_EQ(getErrorCategory(ErrorCode::SERIALIZATION_ERROR), "system");
  EXPECT_EQ(getErrorCategory(ErrorCode::INTERNAL_ERROR), "system");
}

TEST(ErrorCodeTest, NamesAndDescriptions) {
  EXPECT_EQ(errorCodeToString(ErrorCode::METHOD_NOT_ALLOWED),
            "METHOD_NOT_ALLOWED");
  EXPECT_EQ(errorCodeToString(ErrorCode::BIND_FAILED), "BIND_FAILED");
  EXPECT_STREQ(getErrorCodeDescription(ErrorCode::INVALID_FORMAT),
               "Invalid format");
}

TEST(ErrorFactoryTest, CreateValidationError) {
  auto ex = createValidationError("email", "x@", "missing domain");
  EXPECT_EQ(ex.getCode(), ErrorCode::INVALID_INPUT);
  EXPECT_EQ(ex.getMessage(), "Validation failed: missing domain");
  EXPECT_EQ(ex.getContext().at("reason"), "missing domain");
}

TEST(ErrorFactoryTest, CreateSystemError) {
  auto ex = createSystemError(ErrorCode::CONFIGURATION_ERROR, "ConfigManager",
                              "no such key");
  EXPECT_EQ(ex.getCode(), ErrorCode::CONFIGURATION_ERROR);
  EXPECT_EQ(ex.getMessage(), "Configuration error");
  EXPECT_EQ(ex.getComponent(), "ConfigManager");
  EXPECT_EQ(ex.getContext().at("details"), "no such key");
}
