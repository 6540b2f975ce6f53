#pragma once

#include <optional>
#include <string>

// Schema type: raw attributes.
// Unvalidated attribute values as supplied by the caller.
namespace hexref::schema {

struct raw_attributes final {
  std::string type;
  std::optional<std::string> date;
  std::optional<std::string> jurisdiction;
  std::optional<std::string> channel;
  std::string secret;
};

using raw_attributes_t = raw_attributes;

}  // namespace hexref::schema
