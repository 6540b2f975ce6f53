#pragma once
#include <hexref/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace hexref::storage {

using key_value_entry_t =
    std::pair<hexref::schema::bytes_t, hexref::schema::bytes_t>;

/// One step of an atomic write. A missing value deletes the key.
struct write_operation final {
  hexref::schema::bytes_t key;
  std::optional<hexref::schema::bytes_t> value;
};

/// Ordered set of writes applied all-or-nothing by storage::write.
struct write_batch final {
  std::vector<write_operation> operations;

  write_batch& put(hexref::schema::bytes_t key, hexref::schema::bytes_t value);
  write_batch& remove(hexref::schema::bytes_t key);
  bool empty() const { return operations.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hexref::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hexref::schema::bytes_view_t& key,
           const T& value);

  /// True when a value is stored at key.
  bool contains(const hexref::schema::bytes_view_t& key) const;

  /// Apply every operation in order as a single atomic write.
  void write(const write_batch& batch);

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending bytewise key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const hexref::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace hexref::storage
