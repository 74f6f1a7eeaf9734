#include "user.hpp"
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cctype>
#include <stdexcept>

namespace accounts {

void to_json(nlohmann::json &json, const User &user) {
  json = nlohmann::json{{"uuid", uuidToString(user.uuid)},
                        {"firstName", user.firstName},
                        {"lastName", user.lastName},
                        {"email", user.email},
                        {"enabled", user.enabled},
                        {"activated", user.activated}};
}

std::optional<boost::uuids::uuid> parseCanonicalUuid(std::string_view text) {
  // string_generator also accepts braces and unhyphenated input
  if (text.size() != 36) {
    return std::nullopt;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    bool hyphenSlot = i == 8 || i == 13 || i == 18 || i == 23;
    if (hyphenSlot) {
      if (text[i] != '-')
        return std::nullopt;
    } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
      return std::nullopt;
    }
  }

  try {
    return boost::uuids::string_generator()(text.begin(), text.end());
  } catch (const std::runtime_error &) {
    return std::nullopt;
  }
}

std::string uuidToString(const boost::uuids::uuid &uuid) {
  return boost::uuids::to_string(uuid);
}

} // namespace accounts
