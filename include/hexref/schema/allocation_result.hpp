#pragma once

#include <hexref/schema/allocation_error_code.hpp>

#include <cstdint>
#include <string>

// Schema type: allocation result.
// `id` is set only when `code` is ok. `reused` marks an identifier that was
// already committed for the same base key or full key.
namespace hexref::schema {

template <uint16_t Version>
struct allocation_result;

template <>
struct allocation_result<1> final {
  uint16_t version{1};
  allocation_error_code code{allocation_error_code::ok};
  std::string id;
  bool reused{};
  uint32_t attempts{};
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == allocation_error_code::ok; }
};

using allocation_result_t = allocation_result<1>;

}  // namespace hexref::schema
