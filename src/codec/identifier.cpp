#include <hexref/codec/identifier.hpp>
#include <hexref/common/critical.hpp>
#include <hexref/schema/primitives.hpp>

#include <algorithm>

namespace hexref::codec {

namespace {

bool is_upper_hex(const char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F');
}

}  // namespace

bool is_valid_id(std::string_view id) {
  if (id.size() != kIdentifierLength) {
    return false;
  }
  auto digits = id.substr(0, kIdentifierHexDigits);
  return std::ranges::all_of(digits, is_upper_hex) &&
         hexref::schema::is_procedure_symbol(id.back());
}

std::optional<std::string> try_derive_id(
    std::string_view digest_hex,
    const hexref::schema::procedure_type_t type) {
  auto id = hexref::schema::to_upper(
      digest_hex.substr(0, std::min(digest_hex.size(), kIdentifierHexDigits)));
  id.push_back(hexref::schema::to_symbol(type));
  if (!is_valid_id(id)) {
    return std::nullopt;
  }
  return id;
}

std::string derive_id(std::string_view digest_hex,
                      const hexref::schema::procedure_type_t type) {
  auto id = try_derive_id(digest_hex, type);
  if (!id) {
    hexref::common::critical("derived identifier violates the output format");
  }
  return *id;
}

std::optional<hexref::schema::procedure_type_t> type_of(std::string_view id) {
  if (!is_valid_id(id)) {
    return std::nullopt;
  }
  return hexref::schema::try_parse_procedure_type(
      id.substr(kIdentifierHexDigits));
}

}  // namespace hexref::codec
