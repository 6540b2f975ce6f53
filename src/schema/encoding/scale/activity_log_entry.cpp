#include <hexref/schema/encoding/scale/activity_log_entry.hpp>

#include <utility>

using namespace hexref::schema;

namespace hexref::schema::encoding::scale {

tuple_codec<activity_log_entry<1>>::tuple_t
tuple_codec<activity_log_entry<1>>::to_tuple(const activity_log_entry<1>& o) {
  return tuple_t{o.version,
                 o.id,
                 static_cast<uint8_t>(o.type),
                 o.date,
                 o.jurisdiction,
                 o.channel,
                 o.created_at};
}

std::optional<activity_log_entry<1>>
tuple_codec<activity_log_entry<1>>::from_tuple(tuple_t&& t) {
  auto type = try_from_symbol(static_cast<char>(std::get<2>(t)));
  if (std::get<0>(t) != 1 || !type) {
    return std::nullopt;
  }
  auto o = activity_log_entry<1>{};
  o.id = std::move(std::get<1>(t));
  o.type = *type;
  o.date = std::move(std::get<3>(t));
  o.jurisdiction = std::move(std::get<4>(t));
  o.channel = std::move(std::get<5>(t));
  o.created_at = std::move(std::get<6>(t));
  return o;
}

}  // namespace hexref::schema::encoding::scale
