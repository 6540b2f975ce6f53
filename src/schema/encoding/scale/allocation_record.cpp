#include <hexref/schema/encoding/scale/allocation_record.hpp>

#include <utility>

using namespace hexref::schema;

namespace hexref::schema::encoding::scale {

tuple_codec<allocation_record<1>>::tuple_t
tuple_codec<allocation_record<1>>::to_tuple(const allocation_record<1>& o) {
  return tuple_t{o.version,
                 o.id,
                 o.base_key,
                 o.full_key,
                 static_cast<uint8_t>(o.type),
                 o.date,
                 o.jurisdiction,
                 o.channel,
                 o.disambiguator,
                 o.created_at};
}

std::optional<allocation_record<1>>
tuple_codec<allocation_record<1>>::from_tuple(tuple_t&& t) {
  auto type = try_from_symbol(static_cast<char>(std::get<4>(t)));
  if (std::get<0>(t) != 1 || !type) {
    return std::nullopt;
  }
  auto o = allocation_record<1>{};
  o.id = std::move(std::get<1>(t));
  o.base_key = std::move(std::get<2>(t));
  o.full_key = std::move(std::get<3>(t));
  o.type = *type;
  o.date = std::move(std::get<5>(t));
  o.jurisdiction = std::move(std::get<6>(t));
  o.channel = std::move(std::get<7>(t));
  o.disambiguator = std::get<8>(t);
  o.created_at = std::move(std::get<9>(t));
  return o;
}

}  // namespace hexref::schema::encoding::scale
