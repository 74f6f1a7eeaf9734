#include "user.hpp"
#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace accounts;

TEST(UserTest, SerializesWithCamelCaseKeys) {
  User user;
  user.uuid = boost::uuids::string_generator()(
      std::string("550e8400-e29b-41d4-a716-446655440000"));
  user.firstName = "Jane";
  user.lastName = "Doe";
  user.email = "jane.doe@example.com";
  user.enabled = true;
  user.activated = true;

  nlohmann::json json = user;

  EXPECT_EQ(json.size(), 6u);
  EXPECT_EQ(json["uuid"], "550e8400-e29b-41d4-a716-446655440000");
  EXPECT_EQ(json["firstName"], "Jane");
  EXPECT_EQ(json["lastName"], "Doe");
  EXPECT_EQ(json["email"], "jane.doe@example.com");
  EXPECT_EQ(json["enabled"], true);
  EXPECT_EQ(json["activated"], true);
}

TEST(UserTest, BooleansSerializeAsJsonBooleans) {
  User user;
  nlohmann::json json = user;

  EXPECT_TRUE(json["enabled"].is_boolean());
  EXPECT_TRUE(json["activated"].is_boolean());
  EXPECT_EQ(json["uuid"], "00000000-0000-0000-0000-000000000000");
}

TEST(UuidParsingTest, AcceptsCanonicalForm) {
  auto parsed = parseCanonicalUuid("550e8400-e29b-41d4-a716-446655440000");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(uuidToString(*parsed), "550e8400-e29b-41d4-a716-446655440000");
}

TEST(UuidParsingTest, UppercaseIsAcceptedAndEchoedLowercase) {
  auto parsed = parseCanonicalUuid("550E8400-E29B-41D4-A716-446655440000");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(uuidToString(*parsed), "550e8400-e29b-41d4-a716-446655440000");
}

TEST(UuidParsingTest, NilUuidParses) {
  auto parsed = parseCanonicalUuid("00000000-0000-0000-0000-000000000000");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_TRUE(parsed->is_nil());
  EXPECT_EQ(*parsed, boost::uuids::nil_uuid());
}

TEST(UuidParsingTest, RejectsNonCanonicalInput) {
  EXPECT_FALSE(parseCanonicalUuid("").has_value());
  EXPECT_FALSE(parseCanonicalUuid("not-a-uuid").has_value());
  EXPECT_FALSE(parseCanonicalUuid("550e8400e29b41d4a716446655440000").has_value());
  EXPECT_FALSE(
      parseCanonicalUuid("{550e8400-e29b-41d4-a716-446655440000}").has_value());
  EXPECT_FALSE(
      parseCanonicalUuid("550e8400-e29b-41d4-a716-44665544000g").has_value());
  EXPECT_FALSE(
      parseCanonicalUuid("550e8400-e29b-41d4-a716_446655440000").has_value());
  EXPECT_FALSE(
      parseCanonicalUuid("550e8400-e29b-41d4-a716-4466554400000").has_value());
}
