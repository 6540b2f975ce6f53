#pragma once

#include <hexref/codec/identifier.hpp>
#include <hexref/common/time.hpp>
#include <hexref/crypto/hmac.hpp>
#include <hexref/schema/allocation_record.hpp>
#include <hexref/schema/key/canonical.hpp>
#include <hexref/schema/raw_attributes.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace hexref::testing {

// 2024-03-10T12:34:56.789Z
inline hexref::common::time_point_t fixed_time() {
  return hexref::common::time_point_t{std::chrono::milliseconds{1710074096789}};
}

inline hexref::common::clock_fn_t fixed_clock() {
  return [] { return fixed_time(); };
}

inline hexref::schema::raw_attributes_t make_attributes(
    const std::string_view type,
    const std::string_view date,
    const std::string_view jurisdiction,
    const std::string_view channel,
    const std::string_view secret) {
  auto raw = hexref::schema::raw_attributes_t{};
  raw.type = std::string{type};
  raw.date = std::string{date};
  raw.jurisdiction = std::string{jurisdiction};
  raw.channel = std::string{channel};
  raw.secret = std::string{secret};
  return raw;
}

/// Identifier the allocator derives for a base key at a given disambiguator.
inline std::string expected_id(const std::string_view base_key,
                               const hexref::schema::disambiguator_t disambiguator,
                               const std::string_view secret,
                               const hexref::schema::procedure_type_t type) {
  auto full_key =
      hexref::schema::key::make_full_key(base_key, disambiguator, secret);
  return hexref::codec::derive_id(
      hexref::crypto::hmac_sha256_hex(secret, full_key), type);
}

/// Record occupying `id` on behalf of an unrelated base key.
inline hexref::schema::allocation_record_t make_foreign_record(
    const std::string_view id,
    const std::string_view tag) {
  auto record = hexref::schema::allocation_record_t{};
  record.id = std::string{id};
  record.base_key = "v1|M|2000-01-01|" + std::string{tag} + "|WEB";
  record.full_key = record.base_key + "|0|foreign";
  record.type = hexref::schema::procedure_type_t::m;
  record.date = "2000-01-01";
  record.jurisdiction = std::string{tag};
  record.channel = "WEB";
  record.disambiguator = 0;
  record.created_at = "2000-01-01T00:00:00.000Z";
  return record;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace hexref::testing
