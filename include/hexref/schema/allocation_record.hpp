#pragma once

#include <hexref/schema/primitives.hpp>
#include <hexref/schema/procedure_type.hpp>

#include <cstdint>
#include <string>

// Schema type: allocation record.
// One committed identifier with the canonical material that produced it.
// Written once, never updated.
namespace hexref::schema {

template <uint16_t Version>
struct allocation_record;

template <>
struct allocation_record<1> final {
  uint16_t version{1};
  std::string id;
  std::string base_key;
  std::string full_key;
  procedure_type_t type{procedure_type_t::m};
  std::string date;
  std::string jurisdiction;
  std::string channel;
  disambiguator_t disambiguator{};
  std::string created_at;
};

using allocation_record_t = allocation_record<1>;

}  // namespace hexref::schema
