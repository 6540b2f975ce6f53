#include <hexref/exporting/history_csv.hpp>

namespace hexref::exporting {

namespace {

template <typename Fields>
void append_row(std::string& out, const Fields& fields) {
  auto first = true;
  for (const auto& field : fields) {
    if (!first) {
      out.push_back(',');
    }
    first = false;
    out.append(quote_csv_field(field));
  }
}

}  // namespace

std::string quote_csv_field(std::string_view value) {
  auto out = std::string{"\""};
  for (auto c : value) {
    if (c == '"') {
      out.append("\"\"");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

std::string to_csv(
    const std::vector<hexref::schema::activity_log_entry_t>& entries) {
  auto out = std::string{};
  append_row(out, kHistoryCsvHeader);
  for (const auto& entry : entries) {
    out.push_back('\n');
    auto type = hexref::schema::to_string(entry.type);
    append_row(out, std::array<std::string_view, 6>{
                        entry.id, type, entry.date, entry.jurisdiction,
                        entry.channel, entry.created_at});
  }
  return out;
}

std::string make_export_filename(std::string_view date) {
  auto name = std::string{"hexref_history_"};
  name.append(date);
  name.append(".csv");
  return name;
}

}  // namespace hexref::exporting
