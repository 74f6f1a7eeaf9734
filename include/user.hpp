#pragma once

#include <boost/uuid/uuid.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace accounts {

// A user account. Serialized with lower camel case keys.
struct User {
  boost::uuids::uuid uuid{};
  std::string firstName;
  std::string lastName;
  std::string email;
  bool enabled = false;
  bool activated = false;
};

void to_json(nlohmann::json &json, const User &user);

// Accepts only the 36-character hyphenated form
std::optional<boost::uuids::uuid> parseCanonicalUuid(std::string_view text);

std::string uuidToString(const boost::uuids::uuid &uuid);

} // namespace accounts
