#include <hexref/allocation/allocator.hpp>
#include <hexref/codec/identifier.hpp>
#include <hexref/crypto/hmac.hpp>
#include <hexref/exporting/history_csv.hpp>
#include <hexref/schema/key/canonical.hpp>
#include <hexref/storage/memory/storage.hpp>
#include <hexref/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace hexref::schema;

namespace hexref::allocation {

namespace {

inline constexpr std::string_view kCodespace{"hexref.allocate"};

allocation_result_t make_error(const allocation_error_code code,
                               std::string log,
                               std::string info) {
  auto result = allocation_result_t{};
  result.code = code;
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{kCodespace};
  return result;
}

allocation_result_t make_success(std::string id,
                                 const bool reused,
                                 const uint32_t attempts) {
  auto result = allocation_result_t{};
  result.id = std::move(id);
  result.reused = reused;
  result.attempts = attempts;
  result.codespace = std::string{kCodespace};
  return result;
}

allocation_record_t make_record(std::string id,
                                const std::string& base_key,
                                std::string full_key,
                                const normalized_attributes_t& attrs,
                                const disambiguator_t disambiguator,
                                std::string created_at) {
  auto record = allocation_record_t{};
  record.id = std::move(id);
  record.base_key = base_key;
  record.full_key = std::move(full_key);
  record.type = attrs.type;
  record.date = attrs.date;
  record.jurisdiction = attrs.jurisdiction;
  record.channel = attrs.channel;
  record.disambiguator = disambiguator;
  record.created_at = std::move(created_at);
  return record;
}

}  // namespace

template <typename Library>
allocator<Library>::allocator(store<Library>& allocation_store,
                              hexref::common::clock_fn_t clock)
    : store_{allocation_store}, clock_{std::move(clock)} {}

template <typename Library>
allocation_result_t allocator<Library>::allocate(
    const raw_attributes_t& attributes) {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();

  auto error = key::canonical_error{};
  auto normalized = key::normalize(
      attributes, hexref::common::local_date_iso(now), error);
  if (!normalized) {
    return make_error(error.code, "invalid attributes", error.message);
  }

  auto base_key = key::make_base_key(*normalized);
  if (auto existing = store_.lookup_by_base(base_key)) {
    spdlog::debug("Reusing identifier {} for existing base key", *existing);
    return make_success(std::move(*existing), true, 0);
  }

  normalized->disambiguator = store_.next_disambiguator(base_key);
  for (auto attempt = uint32_t{1}; attempt <= kMaxAllocationAttempts;
       ++attempt) {
    auto full_key = key::make_full_key(base_key, normalized->disambiguator,
                                       normalized->secret);
    auto digest_hex = hexref::crypto::hmac_sha256_hex(normalized->secret,
                                                      full_key);
    auto id = hexref::codec::derive_id(digest_hex, normalized->type);

    if (!store_.exists(id)) {
      auto record = make_record(id, base_key, std::move(full_key), *normalized,
                                normalized->disambiguator,
                                hexref::common::utc_timestamp_iso(now));
      store_.commit(record, normalized->disambiguator + 1);
      spdlog::debug("Allocated identifier {} on attempt {}", id, attempt);
      return make_success(std::move(id), false, attempt);
    }

    auto existing = store_.get(id);
    if (existing && existing->full_key == full_key) {
      spdlog::debug("Identifier {} already holds this full key", id);
      return make_success(std::move(id), true, attempt);
    }

    spdlog::debug("Identifier {} collides at disambiguator {}", id,
                  normalized->disambiguator);
    ++normalized->disambiguator;
  }

  return make_error(allocation_error_code::unresolved_collision,
                    "unresolved collision",
                    "no free identifier after " +
                        std::to_string(kMaxAllocationAttempts) + " attempts");
}

template <typename Library>
std::vector<activity_log_entry_t> allocator<Library>::history() const {
  auto lock = std::scoped_lock{mutex_};
  return store_.history();
}

template <typename Library>
std::string allocator<Library>::export_history() const {
  return hexref::exporting::to_csv(history());
}

template <typename Library>
std::optional<allocation_record_t> allocator<Library>::lookup(
    std::string_view id) const {
  if (!hexref::codec::is_valid_id(id)) {
    return std::nullopt;
  }
  auto lock = std::scoped_lock{mutex_};
  return store_.get(id);
}

template class allocator<hexref::storage::rocksdb_storage_tag>;
template class allocator<hexref::storage::memory_storage_tag>;

}  // namespace hexref::allocation
