#pragma once

#include <hexref/allocation/store.hpp>
#include <hexref/common/time.hpp>
#include <hexref/schema/activity_log_entry.hpp>
#include <hexref/schema/allocation_record.hpp>
#include <hexref/schema/allocation_result.hpp>
#include <hexref/schema/raw_attributes.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hexref::allocation {

/// Total digest attempts per allocation, the first one included.
inline constexpr uint32_t kMaxAllocationAttempts = 6;

/// Derives procedure identifiers and records them in a store.
///
/// An identifier is the first seven hex digits of
/// HMAC-SHA256(secret, full key) followed by the type symbol. A base key that
/// already has an identifier gets it back without any digest work. When a
/// derived identifier belongs to a different full key, the disambiguator is
/// bumped and the digest retried, up to kMaxAllocationAttempts in total.
template <typename Library>
class allocator final {
 public:
  /// `clock` supplies both the substitute date for missing or malformed
  /// dates and the creation timestamp of new records.
  explicit allocator(store<Library>& allocation_store,
                     hexref::common::clock_fn_t clock =
                         hexref::common::system_now);

  /// Return the identifier for the attributes, allocating one if needed.
  hexref::schema::allocation_result_t allocate(
      const hexref::schema::raw_attributes_t& attributes);

  /// Activity log, newest first.
  std::vector<hexref::schema::activity_log_entry_t> history() const;

  /// Activity log rendered as comma separated text with a header row.
  std::string export_history() const;

  /// Stored record for a well-formed identifier.
  std::optional<hexref::schema::allocation_record_t> lookup(
      std::string_view id) const;

 private:
  mutable std::mutex mutex_;
  store<Library>& store_;
  hexref::common::clock_fn_t clock_;
};

}  // namespace hexref::allocation
