#pragma once
#include <hexref/schema/primitives.hpp>
#include <optional>
#include <span>

namespace hexref::schema::encoding {

// The wire library is a build time choice selected by tag, e.g.
// encoder<scale_encoder_tag>. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  hexref::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, hexref::schema::bytes_t& out);

  template <typename T>
  T decode(const hexref::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hexref::schema::bytes_view_t& bytes);
};

}  // namespace hexref::schema::encoding
