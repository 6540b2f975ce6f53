#pragma once

#include <hexref/schema/primitives.hpp>
#include <hexref/schema/procedure_type.hpp>

#include <string>

// Schema type: normalized attributes.
// Output of the canonicalizer. `disambiguator` is the next counter value read
// from the store for the attributes' base key.
namespace hexref::schema {

struct normalized_attributes final {
  procedure_type_t type{procedure_type_t::m};
  std::string date;
  std::string jurisdiction;
  std::string channel;
  disambiguator_t disambiguator{};
  std::string secret;
};

using normalized_attributes_t = normalized_attributes;

}  // namespace hexref::schema
