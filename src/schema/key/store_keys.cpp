#include <hexref/schema/key/builder.hpp>
#include <hexref/schema/key/store_keys.hpp>

#include <boost/endian/conversion.hpp>
#include <cstring>

using namespace hexref::schema;

namespace hexref::schema::key {

bytes_t make_id_key(std::string_view id) {
  auto b = builder{};
  b.write(kIdKeyPrefix);
  b.write(id);
  return b.data;
}

bytes_t make_base_index_key(std::string_view base_key) {
  auto b = builder{};
  b.write(kBaseIndexKeyPrefix);
  b.write(base_key);
  return b.data;
}

bytes_t make_counter_key(std::string_view base_key) {
  auto b = builder{};
  b.write(kCounterKeyPrefix);
  b.write(base_key);
  return b.data;
}

bytes_t make_history_seq_key() {
  return make_bytes(kHistorySeqKey);
}

bytes_t make_history_log_key(const sequence_t sequence) {
  auto b = builder{};
  b.write(kHistoryLogPrefix);
  b.write(sequence);
  return b.data;
}

bytes_t make_history_log_prefix() {
  return make_bytes(kHistoryLogPrefix);
}

bytes_t make_remembered_secret_key() {
  return make_bytes(kRememberedSecretKey);
}

std::optional<sequence_t> parse_history_log_key(const bytes_view_t& key) {
  if (key.size() != kHistoryLogPrefix.size() + sizeof(sequence_t) ||
      !make_string_view(key).starts_with(kHistoryLogPrefix)) {
    return std::nullopt;
  }
  auto big = sequence_t{};
  std::memcpy(&big, key.data() + kHistoryLogPrefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace hexref::schema::key
