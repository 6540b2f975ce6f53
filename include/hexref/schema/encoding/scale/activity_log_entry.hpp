#pragma once

#include <hexref/schema/activity_log_entry.hpp>
#include <hexref/schema/encoding/scale/tuple_codec.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace hexref::schema::encoding::scale {

template <>
struct tuple_codec<hexref::schema::activity_log_entry<1>> {
  static constexpr bool enabled = true;
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             uint8_t,
                             std::string,
                             std::string,
                             std::string,
                             std::string>;

  static tuple_t to_tuple(const hexref::schema::activity_log_entry<1>& o);
  static std::optional<hexref::schema::activity_log_entry<1>> from_tuple(
      tuple_t&& t);
};

}  // namespace hexref::schema::encoding::scale
