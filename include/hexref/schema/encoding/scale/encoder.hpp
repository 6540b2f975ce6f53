#pragma once
#include <hexref/common/critical.hpp>
#include <hexref/schema/encoding/encoder.hpp>
#include <hexref/schema/encoding/scale/activity_log_entry.hpp>
#include <hexref/schema/encoding/scale/allocation_record.hpp>
#include <hexref/schema/encoding/scale/tuple_codec.hpp>
#include <iterator>
#include <utility>
#include <scale/scale.hpp>

namespace hexref::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  hexref::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hexref::schema::bytes_t& out);

  template <typename T>
  T decode(const hexref::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hexref::schema::bytes_view_t& bytes);
};

template <typename T>
hexref::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  if constexpr (scale::tuple_codec<T>::enabled) {
    return encode(scale::tuple_codec<T>::to_tuple(obj));
  } else {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      hexref::common::critical("failed to encode SCALE object");
    }
    return encoded.value();
  }
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        hexref::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const hexref::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    hexref::common::critical("failed to decode SCALE bytes");
  }
  return std::move(decoded.value());
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const hexref::schema::bytes_view_t& bytes) {
  if constexpr (scale::tuple_codec<T>::enabled) {
    using tuple_t = typename scale::tuple_codec<T>::tuple_t;
    auto decoded = try_decode<tuple_t>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return scale::tuple_codec<T>::from_tuple(std::move(decoded.value()));
  } else {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return decoded.value();
  }
}

}  // namespace hexref::schema::encoding
