#include <hexref/allocation/store.hpp>
#include <hexref/codec/identifier.hpp>
#include <hexref/common/critical.hpp>
#include <hexref/schema/key/store_keys.hpp>
#include <hexref/storage/memory/storage.hpp>
#include <hexref/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace hexref::schema;

namespace hexref::allocation {

namespace {

activity_log_entry_t make_log_entry(const allocation_record_t& record) {
  auto entry = activity_log_entry_t{};
  entry.id = record.id;
  entry.type = record.type;
  entry.date = record.date;
  entry.jurisdiction = record.jurisdiction;
  entry.channel = record.channel;
  entry.created_at = record.created_at;
  return entry;
}

}  // namespace

template <typename Library>
store<Library>::store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

template <typename Library>
std::optional<std::string> store<Library>::lookup_by_base(
    std::string_view base_key) const {
  auto key = key::make_base_index_key(base_key);
  return storage_.template get<std::string>(encoder_, make_bytes_view(key));
}

template <typename Library>
bool store<Library>::exists(std::string_view id) const {
  auto key = key::make_id_key(id);
  return storage_.contains(make_bytes_view(key));
}

template <typename Library>
std::optional<allocation_record_t> store<Library>::get(
    std::string_view id) const {
  auto key = key::make_id_key(id);
  return storage_.template get<allocation_record_t>(encoder_,
                                                    make_bytes_view(key));
}

template <typename Library>
disambiguator_t store<Library>::next_disambiguator(
    std::string_view base_key) const {
  auto key = key::make_counter_key(base_key);
  return storage_.template get<disambiguator_t>(encoder_, make_bytes_view(key))
      .value_or(disambiguator_t{0});
}

template <typename Library>
sequence_t store<Library>::next_history_sequence() const {
  auto key = key::make_history_seq_key();
  return storage_.template get<sequence_t>(encoder_, make_bytes_view(key))
      .value_or(sequence_t{0});
}

template <typename Library>
void store<Library>::commit(const allocation_record_t& record,
                            const disambiguator_t next_disambiguator) {
  if (!hexref::codec::is_valid_id(record.id)) {
    hexref::common::critical("refusing to commit malformed identifier");
  }
  if (!record.full_key.starts_with(record.base_key)) {
    hexref::common::critical("full key does not extend its base key");
  }
  if (next_disambiguator <= record.disambiguator) {
    hexref::common::critical("disambiguator counter must advance past record");
  }
  if (exists(record.id)) {
    hexref::common::critical("identifier is already allocated");
  }

  auto counter = std::max(next_disambiguator,
                          this->next_disambiguator(record.base_key));
  auto sequence = next_history_sequence();

  auto batch = hexref::storage::write_batch{};
  batch.put(key::make_id_key(record.id), encoder_.encode(record));
  batch.put(key::make_base_index_key(record.base_key),
            encoder_.encode(record.id));
  batch.put(key::make_counter_key(record.base_key), encoder_.encode(counter));
  batch.put(key::make_history_log_key(sequence),
            encoder_.encode(make_log_entry(record)));
  batch.put(key::make_history_seq_key(), encoder_.encode(sequence + 1));

  // Keep only the newest kActivityLogCapacity rows, this one included.
  auto log_prefix = key::make_history_log_prefix();
  for (const auto& [log_key, value] :
       storage_.list_by_prefix(make_bytes_view(log_prefix))) {
    auto row = key::parse_history_log_key(make_bytes_view(log_key));
    if (!row || *row + kActivityLogCapacity <= sequence) {
      batch.remove(log_key);
    }
  }

  storage_.write(batch);
  spdlog::debug("Committed identifier {} (disambiguator {}, history row {})",
                record.id, record.disambiguator, sequence);
}

template <typename Library>
std::vector<activity_log_entry_t> store<Library>::history() const {
  auto log_prefix = key::make_history_log_prefix();
  auto rows = storage_.list_by_prefix(make_bytes_view(log_prefix));

  auto entries = std::vector<activity_log_entry_t>{};
  entries.reserve(std::min(rows.size(), kActivityLogCapacity));
  for (auto it = std::rbegin(rows);
       it != std::rend(rows) && entries.size() < kActivityLogCapacity; ++it) {
    auto entry = encoder_.template try_decode<activity_log_entry_t>(
        make_bytes_view(it->second));
    if (!entry) {
      spdlog::warn("Skipping undecodable activity log row {}",
                   key::parse_history_log_key(make_bytes_view(it->first))
                       .value_or(sequence_t{0}));
      continue;
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

template <typename Library>
std::optional<std::string> store<Library>::remembered_secret() const {
  auto key = key::make_remembered_secret_key();
  auto secret =
      storage_.template get<std::string>(encoder_, make_bytes_view(key));
  if (secret && secret->empty()) {
    return std::nullopt;
  }
  return secret;
}

template <typename Library>
void store<Library>::remember_secret(std::string_view secret) {
  if (secret.empty()) {
    return;
  }
  auto batch = hexref::storage::write_batch{};
  batch.put(key::make_remembered_secret_key(),
            encoder_.encode(std::string{secret}));
  storage_.write(batch);
}

template <typename Library>
void store<Library>::forget_secret() {
  auto batch = hexref::storage::write_batch{};
  batch.remove(key::make_remembered_secret_key());
  storage_.write(batch);
}

template class store<hexref::storage::rocksdb_storage_tag>;
template class store<hexref::storage::memory_storage_tag>;

}  // namespace hexref::allocation
