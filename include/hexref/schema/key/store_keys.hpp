#pragma once

#include <hexref/schema/primitives.hpp>

#include <optional>
#include <string_view>

// Schema key type: store keys.
// Keyspaces of the allocation store. Values are SCALE encoded; keys are raw
// bytes so that prefix scans stay ordered.
namespace hexref::schema::key {

inline constexpr std::string_view kIdKeyPrefix{"SYS|STATE|ID|"};
inline constexpr std::string_view kBaseIndexKeyPrefix{"SYS|STATE|BASE|"};
inline constexpr std::string_view kCounterKeyPrefix{"SYS|STATE|COUNTER|"};
inline constexpr std::string_view kHistorySeqKey{"SYS|HISTORY|SEQ"};
inline constexpr std::string_view kHistoryLogPrefix{"SYS|HISTORY|LOG|"};
inline constexpr std::string_view kRememberedSecretKey{"SYS|CONFIG|SECRET"};

hexref::schema::bytes_t make_id_key(std::string_view id);
hexref::schema::bytes_t make_base_index_key(std::string_view base_key);
hexref::schema::bytes_t make_counter_key(std::string_view base_key);
hexref::schema::bytes_t make_history_seq_key();
hexref::schema::bytes_t make_history_log_key(sequence_t sequence);
hexref::schema::bytes_t make_history_log_prefix();
hexref::schema::bytes_t make_remembered_secret_key();

/// Recover the sequence number from a history log key.
std::optional<sequence_t> parse_history_log_key(
    const hexref::schema::bytes_view_t& key);

}  // namespace hexref::schema::key
