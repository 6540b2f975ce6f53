#pragma once

#include <hexref/schema/allocation_error_code.hpp>
#include <hexref/schema/normalized_attributes.hpp>
#include <hexref/schema/primitives.hpp>
#include <hexref/schema/raw_attributes.hpp>

#include <optional>
#include <string>
#include <string_view>

// Schema key type: canonical keys.
// Normalization of raw attributes and the two canonical strings derived from
// them: the base key (idempotence identity) and the full key (digest input).
namespace hexref::schema::key {

inline constexpr std::string_view kCanonicalVersion{"v1"};
inline constexpr char kCanonicalDelimiter{'|'};
inline constexpr std::string_view kDefaultChannel{"WEB"};

struct canonical_error final {
  allocation_error_code code{allocation_error_code::ok};
  std::string message;
};

/// True when `value` is exactly four digits, a dash, two digits, a dash and
/// two digits. Calendar validity is not checked.
bool is_iso_date(std::string_view value);

/// Normalize raw attributes. `today` replaces an absent or malformed date.
///
/// Returns std::nullopt and fills `error` on an unknown type, an empty secret,
/// or a jurisdiction or channel that holds the canonical delimiter or a
/// non-ASCII byte. Case folding is ASCII only. The returned
/// `disambiguator` is always 0; the allocator fills it from the store.
std::optional<hexref::schema::normalized_attributes_t> normalize(
    const hexref::schema::raw_attributes_t& raw,
    std::string_view today,
    canonical_error& error);

/// `v1|type|date|jurisdiction|channel`
std::string make_base_key(const hexref::schema::normalized_attributes_t& attrs);

/// `base|disambiguator|secret`
std::string make_full_key(std::string_view base_key,
                          hexref::schema::disambiguator_t disambiguator,
                          std::string_view secret);

}  // namespace hexref::schema::key
