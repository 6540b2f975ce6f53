#include <hexref/storage/memory/storage.hpp>

#include <spdlog/spdlog.h>

namespace hexref::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Opening in-memory storage (path '{}' ignored)", path);
  return storage<memory_storage_tag>{};
}

bool storage<memory_storage_tag>::contains(
    const hexref::schema::bytes_view_t& key) const {
  return entries.contains(hexref::schema::make_bytes(key));
}

void storage<memory_storage_tag>::write(const write_batch& batch) {
  for (const auto& operation : batch.operations) {
    if (operation.value) {
      entries.insert_or_assign(operation.key, *operation.value);
    } else {
      entries.erase(operation.key);
    }
  }
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const hexref::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  auto prefix_view = hexref::schema::make_string_view(prefix);
  for (auto it = entries.lower_bound(hexref::schema::make_bytes(prefix));
       it != std::end(entries); ++it) {
    if (!hexref::schema::make_string_view(it->first).starts_with(prefix_view)) {
      break;
    }
    out.push_back(*it);
  }
  return out;
}

}  // namespace hexref::storage
