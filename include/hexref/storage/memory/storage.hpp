#pragma once
#include <hexref/storage/storage.hpp>
#include <map>
#include <string_view>

namespace hexref::storage {

/// Process-local backend over an ordered map. Nothing survives the object;
/// intended for tests and dry runs.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<hexref::schema::bytes_t, hexref::schema::bytes_t> entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const hexref::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const hexref::schema::bytes_view_t& key,
           const T& value);

  bool contains(const hexref::schema::bytes_view_t& key) const;
  void write(const write_batch& batch);
  std::vector<key_value_entry_t> list_by_prefix(
      const hexref::schema::bytes_view_t& prefix) const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const hexref::schema::bytes_view_t& key) const {
  auto it = entries.find(hexref::schema::make_bytes(key));
  if (it == std::end(entries)) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(hexref::schema::make_bytes_view(it->second))};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const hexref::schema::bytes_view_t& key,
                                      const T& value) {
  entries[hexref::schema::make_bytes(key)] = encoder.encode(value);
}

}  // namespace hexref::storage
