#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: procedure type.
// Closed set of type symbols. The symbol is the last character of every
// allocated identifier.
namespace hexref::schema {

enum class procedure_type_t : uint8_t {
  c = 'C',
  m = 'M',
  s = 'S',
  i = 'I',
  a = 'A'
};

inline constexpr auto kProcedureTypes =
    std::array<procedure_type_t, 5>{procedure_type_t::c, procedure_type_t::m,
                                    procedure_type_t::s, procedure_type_t::i,
                                    procedure_type_t::a};

inline constexpr char to_symbol(const procedure_type_t value) {
  return static_cast<char>(value);
}

inline constexpr std::optional<procedure_type_t> try_from_symbol(
    const char symbol) {
  for (const auto type : kProcedureTypes) {
    if (to_symbol(type) == symbol) {
      return type;
    }
  }
  return std::nullopt;
}

inline constexpr bool is_procedure_symbol(const char c) {
  return try_from_symbol(c).has_value();
}

/// Exactly one uppercase symbol; callers normalize case beforehand.
inline constexpr std::optional<procedure_type_t> try_parse_procedure_type(
    const std::string_view value) {
  if (value.size() != 1) {
    return std::nullopt;
  }
  return try_from_symbol(value.front());
}

/// One-character name used in logs, history output and CSV rows.
inline std::string_view to_string(const procedure_type_t value) {
  static constexpr auto kNames = std::array<std::string_view, 5>{
      "C", "M", "S", "I", "A"};
  auto it = std::ranges::find(kProcedureTypes, value);
  if (it == std::end(kProcedureTypes)) {
    return "?";
  }
  return kNames[static_cast<std::size_t>(it - std::begin(kProcedureTypes))];
}

}  // namespace hexref::schema
