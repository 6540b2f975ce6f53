#pragma once

namespace hexref::schema::encoding::scale {

/// Schema structs are persisted as SCALE tuples of their fields.
/// Specializations provide `tuple_t`, `to_tuple` and `from_tuple`;
/// `from_tuple` rejects rows with an unknown version or type symbol.
template <typename T>
struct tuple_codec {
  static constexpr bool enabled = false;
};

}  // namespace hexref::schema::encoding::scale
