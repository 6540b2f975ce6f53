#pragma once

#include <hexref/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace hexref::crypto {

/// HMAC-SHA256 of `message` keyed with `key`.
hexref::schema::hash32_t hmac_sha256(const hexref::schema::bytes_view_t& key,
                                     const hexref::schema::bytes_view_t& message);

hexref::schema::hash32_t hmac_sha256(std::string_view key,
                                     std::string_view message);

/// HMAC-SHA256 rendered as 64 uppercase hexadecimal characters.
std::string hmac_sha256_hex(std::string_view key, std::string_view message);

}  // namespace hexref::crypto
