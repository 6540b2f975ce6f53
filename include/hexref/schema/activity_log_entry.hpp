#pragma once

#include <hexref/schema/procedure_type.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

// Schema type: activity log entry.
// Observational history row; never consulted for allocation decisions.
namespace hexref::schema {

inline constexpr std::size_t kActivityLogCapacity = 200;

template <uint16_t Version>
struct activity_log_entry;

template <>
struct activity_log_entry<1> final {
  uint16_t version{1};
  std::string id;
  procedure_type_t type{procedure_type_t::m};
  std::string date;
  std::string jurisdiction;
  std::string channel;
  std::string created_at;
};

using activity_log_entry_t = activity_log_entry<1>;

}  // namespace hexref::schema
