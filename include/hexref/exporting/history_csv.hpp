#pragma once

#include <hexref/schema/activity_log_entry.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace hexref::exporting {

inline constexpr auto kHistoryCsvHeader = std::array<std::string_view, 6>{
    "id", "type", "date", "juridiction", "canal", "createdAt"};

/// Double-quote a field, doubling embedded quotes.
std::string quote_csv_field(std::string_view value);

/// Header plus one row per entry, every field quoted, rows separated by '\n'
/// with no trailing newline. Pure formatting; writing is the caller's job.
std::string to_csv(
    const std::vector<hexref::schema::activity_log_entry_t>& entries);

/// `hexref_history_<date>.csv`
std::string make_export_filename(std::string_view date);

}  // namespace hexref::exporting
