#pragma once

#include <cstdint>

namespace hexref::schema {

enum class allocation_error_code : uint32_t {
  ok = 0,
  invalid_type = 1,
  missing_secret = 2,
  invalid_field = 3,
  unresolved_collision = 4,
};

}  // namespace hexref::schema
