#pragma once

#include <hexref/schema/allocation_record.hpp>
#include <hexref/schema/encoding/scale/tuple_codec.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace hexref::schema::encoding::scale {

template <>
struct tuple_codec<hexref::schema::allocation_record<1>> {
  static constexpr bool enabled = true;
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             std::string,
                             uint8_t,
                             std::string,
                             std::string,
                             std::string,
                             uint32_t,
                             std::string>;

  static tuple_t to_tuple(const hexref::schema::allocation_record<1>& o);
  static std::optional<hexref::schema::allocation_record<1>> from_tuple(
      tuple_t&& t);
};

}  // namespace hexref::schema::encoding::scale
