#include <gtest/gtest.h>
#include <hexref/schema/encoding/scale/encoder.hpp>
#include <hexref/schema/key/store_keys.hpp>
#include <hexref/storage/memory/storage.hpp>
#include <hexref/storage/rocksdb/storage.hpp>
#include <hexref/storage/storage.hpp>
#include <hexref/testing/common.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace {

using encoder_t = hexref::schema::encoding::encoder<
    hexref::schema::encoding::scale_encoder_tag>;

template <typename Storage>
void exercise_write_batch(Storage& storage) {
  auto encoder = encoder_t{};
  auto a1 = hexref::schema::make_bytes(std::string_view{"A|one"});
  auto a2 = hexref::schema::make_bytes(std::string_view{"A|two"});
  auto b1 = hexref::schema::make_bytes(std::string_view{"B|one"});
  storage.put(encoder, hexref::schema::make_bytes_view(a1), uint64_t{1});

  auto batch = hexref::storage::write_batch{};
  batch.put(a2, encoder.encode(uint64_t{2}))
      .put(b1, encoder.encode(uint64_t{9}))
      .remove(a1);
  storage.write(batch);

  EXPECT_FALSE(storage.contains(hexref::schema::make_bytes_view(a1)));
  EXPECT_TRUE(storage.contains(hexref::schema::make_bytes_view(a2)));
  auto value = storage.template get<uint64_t>(
      encoder, hexref::schema::make_bytes_view(b1));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value.value(), 9u);

  auto prefix = hexref::schema::make_bytes(std::string_view{"A|"});
  auto rows = storage.list_by_prefix(hexref::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].first, a2);
}

template <typename Storage>
void exercise_history_key_order(Storage& storage) {
  auto batch = hexref::storage::write_batch{};
  for (auto sequence : {uint64_t{256}, uint64_t{1}, uint64_t{255}}) {
    batch.put(hexref::schema::key::make_history_log_key(sequence),
              hexref::schema::bytes_t{0x00});
  }
  storage.write(batch);

  auto prefix = hexref::schema::key::make_history_log_prefix();
  auto rows = storage.list_by_prefix(hexref::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(hexref::schema::key::parse_history_log_key(
                hexref::schema::make_bytes_view(rows[0].first)),
            1u);
  EXPECT_EQ(hexref::schema::key::parse_history_log_key(
                hexref::schema::make_bytes_view(rows[1].first)),
            255u);
  EXPECT_EQ(hexref::schema::key::parse_history_log_key(
                hexref::schema::make_bytes_view(rows[2].first)),
            256u);
}

template <typename Storage>
void exercise_overwrite_and_delete_in_one_batch(Storage& storage) {
  auto key = hexref::schema::make_bytes(std::string_view{"A|same"});
  auto other = hexref::schema::make_bytes(std::string_view{"A|other"});

  auto batch = hexref::storage::write_batch{};
  batch.put(key, hexref::schema::bytes_t{0x01})
      .put(key, hexref::schema::bytes_t{0x02})
      .put(other, hexref::schema::bytes_t{0x03})
      .remove(other)
      .put(other, hexref::schema::bytes_t{0x04});
  storage.write(batch);

  auto prefix = hexref::schema::make_bytes(std::string_view{"A|"});
  auto rows = storage.list_by_prefix(hexref::schema::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, other);
  EXPECT_EQ(rows[0].second, hexref::schema::bytes_t{0x04});
  EXPECT_EQ(rows[1].first, key);
  EXPECT_EQ(rows[1].second, hexref::schema::bytes_t{0x02});

  auto removal = hexref::storage::write_batch{};
  removal.remove(key).remove(other);
  storage.write(removal);
  EXPECT_TRUE(
      storage.list_by_prefix(hexref::schema::make_bytes_view(prefix)).empty());
}

}  // namespace

TEST(storage_types, memory_batch_overwrites_and_deletes_in_order) {
  auto storage =
      hexref::storage::make_storage<hexref::storage::memory_storage_tag>("");
  exercise_overwrite_and_delete_in_one_batch(storage);
  EXPECT_TRUE(storage.entries.empty());
}

TEST(storage_types, rocksdb_batch_overwrites_and_deletes_in_order) {
  auto db = hexref::testing::make_db_path("hexref_storage_overwrite");
  {
    auto storage =
        hexref::storage::make_storage<hexref::storage::rocksdb_storage_tag>(db);
    exercise_overwrite_and_delete_in_one_batch(storage);
  }
  hexref::testing::remove_path(db);
}

TEST(storage_types, memory_write_batch_applies_in_order) {
  auto storage =
      hexref::storage::make_storage<hexref::storage::memory_storage_tag>("");
  exercise_write_batch(storage);
}

TEST(storage_types, rocksdb_write_batch_applies_in_order) {
  auto db = hexref::testing::make_db_path("hexref_storage_batch");
  {
    auto storage =
        hexref::storage::make_storage<hexref::storage::rocksdb_storage_tag>(db);
    exercise_write_batch(storage);
  }
  hexref::testing::remove_path(db);
}

TEST(storage_types, memory_history_keys_sort_numerically) {
  auto storage =
      hexref::storage::make_storage<hexref::storage::memory_storage_tag>("");
  exercise_history_key_order(storage);
}

TEST(storage_types, rocksdb_history_keys_sort_numerically) {
  auto db = hexref::testing::make_db_path("hexref_storage_order");
  {
    auto storage =
        hexref::storage::make_storage<hexref::storage::rocksdb_storage_tag>(db);
    exercise_history_key_order(storage);
  }
  hexref::testing::remove_path(db);
}

TEST(storage_types, rocksdb_values_survive_reopen) {
  auto db = hexref::testing::make_db_path("hexref_storage_reopen");
  auto encoder = encoder_t{};
  auto key = hexref::schema::make_bytes(std::string_view{"SYS|STATE|X"});
  {
    auto storage =
        hexref::storage::make_storage<hexref::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, hexref::schema::make_bytes_view(key),
                std::string{"kept"});
  }
  {
    auto storage =
        hexref::storage::make_storage<hexref::storage::rocksdb_storage_tag>(db);
    auto value = storage.get<std::string>(encoder,
                                          hexref::schema::make_bytes_view(key));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "kept");
  }
  hexref::testing::remove_path(db);
}

TEST(storage_keys, parse_history_log_key_rejects_foreign_keys) {
  auto id_key = hexref::schema::key::make_id_key("012E9DDM");
  EXPECT_FALSE(hexref::schema::key::parse_history_log_key(
      hexref::schema::make_bytes_view(id_key)));
  auto short_key = hexref::schema::key::make_history_log_prefix();
  EXPECT_FALSE(hexref::schema::key::parse_history_log_key(
      hexref::schema::make_bytes_view(short_key)));
}

TEST(storage_keys, key_makers_use_their_keyspace_prefixes) {
  namespace key = hexref::schema::key;
  auto as_string = [](const hexref::schema::bytes_t& bytes) {
    return hexref::schema::make_string(bytes);
  };
  EXPECT_EQ(as_string(key::make_id_key("012E9DDM")), "SYS|STATE|ID|012E9DDM");
  EXPECT_EQ(as_string(key::make_base_index_key("v1|M|2024-01-15|CH-BL|WEB")),
            "SYS|STATE|BASE|v1|M|2024-01-15|CH-BL|WEB");
  EXPECT_EQ(as_string(key::make_counter_key("v1|M|2024-01-15|CH-BL|WEB")),
            "SYS|STATE|COUNTER|v1|M|2024-01-15|CH-BL|WEB");
  EXPECT_EQ(as_string(key::make_history_seq_key()), "SYS|HISTORY|SEQ");
  EXPECT_EQ(as_string(key::make_remembered_secret_key()), "SYS|CONFIG|SECRET");

  auto log_key = key::make_history_log_key(0x0102);
  EXPECT_EQ(log_key.size(), key::kHistoryLogPrefix.size() + 8u);
  EXPECT_EQ(hexref::schema::make_string_view(log_key).substr(
                0, key::kHistoryLogPrefix.size()),
            "SYS|HISTORY|LOG|");
  EXPECT_EQ(log_key.back(), 0x02);
  EXPECT_EQ(log_key[log_key.size() - 2], 0x01);
}
