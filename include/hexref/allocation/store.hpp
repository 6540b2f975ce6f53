#pragma once

#include <hexref/schema/activity_log_entry.hpp>
#include <hexref/schema/allocation_record.hpp>
#include <hexref/schema/encoding/scale/encoder.hpp>
#include <hexref/schema/primitives.hpp>
#include <hexref/storage/storage.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hexref::allocation {

/// Durable allocation state over a storage backend.
///
/// Four keyspaces are kept mutually consistent: id -> record, base key -> id,
/// base key -> next disambiguator, and the bounded activity log. `commit` is
/// the only writer of the first three and touches them in one atomic batch.
/// The store does not lock; callers serialize writers.
template <typename Library>
class store final {
 public:
  using storage_t = hexref::storage::storage<Library>;
  using encoder_t = hexref::schema::encoding::encoder<
      hexref::schema::encoding::scale_encoder_tag>;

  store(encoder_t& encoder, storage_t& storage);

  /// Identifier previously committed for the base key.
  std::optional<std::string> lookup_by_base(std::string_view base_key) const;

  bool exists(std::string_view id) const;

  std::optional<hexref::schema::allocation_record_t> get(
      std::string_view id) const;

  /// Next disambiguator to try for the base key; 0 when none was committed.
  hexref::schema::disambiguator_t next_disambiguator(
      std::string_view base_key) const;

  /// Atomically persist a new record, its base index entry, the advanced
  /// counter and an activity log entry, evicting log rows past capacity.
  ///
  /// A record that is malformed, already present, or whose counter would not
  /// exceed its disambiguator is a caller bug and terminates.
  void commit(const hexref::schema::allocation_record_t& record,
              hexref::schema::disambiguator_t next_disambiguator);

  /// Activity log, newest first, at most kActivityLogCapacity entries.
  std::vector<hexref::schema::activity_log_entry_t> history() const;

  std::optional<std::string> remembered_secret() const;

  /// Persist a secret for later calls. Empty secrets are ignored.
  void remember_secret(std::string_view secret);
  void forget_secret();

 private:
  hexref::schema::sequence_t next_history_sequence() const;

  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace hexref::allocation
