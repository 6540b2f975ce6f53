#pragma once

#include <hexref/schema/procedure_type.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace hexref::codec {

inline constexpr std::size_t kIdentifierHexDigits = 7;
inline constexpr std::size_t kIdentifierLength = kIdentifierHexDigits + 1;

/// True for exactly seven uppercase hex digits followed by C, M, S, I or A.
bool is_valid_id(std::string_view id);

/// First seven digest characters, uppercased, followed by the type symbol.
///
/// Returns std::nullopt when the result does not satisfy is_valid_id, which
/// only happens for a digest that is not hexadecimal or is too short.
std::optional<std::string> try_derive_id(std::string_view digest_hex,
                                         hexref::schema::procedure_type_t type);

/// As try_derive_id, but a malformed result is a broken invariant and
/// terminates through hexref::common::critical.
std::string derive_id(std::string_view digest_hex,
                      hexref::schema::procedure_type_t type);

/// Type symbol carried by a well-formed identifier.
std::optional<hexref::schema::procedure_type_t> type_of(std::string_view id);

}  // namespace hexref::codec
