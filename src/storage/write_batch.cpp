#include <hexref/storage/storage.hpp>

#include <utility>

namespace hexref::storage {

write_batch& write_batch::put(hexref::schema::bytes_t key,
                              hexref::schema::bytes_t value) {
  operations.push_back(write_operation{std::move(key), std::move(value)});
  return *this;
}

write_batch& write_batch::remove(hexref::schema::bytes_t key) {
  operations.push_back(write_operation{std::move(key), std::nullopt});
  return *this;
}

}  // namespace hexref::storage
