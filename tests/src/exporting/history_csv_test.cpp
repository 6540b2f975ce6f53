#include <gtest/gtest.h>
#include <hexref/exporting/history_csv.hpp>

#include <vector>

TEST(history_csv, empty_history_is_header_only) {
  EXPECT_EQ(hexref::exporting::to_csv({}),
            "\"id\",\"type\",\"date\",\"juridiction\",\"canal\",\"createdAt\"");
}

TEST(history_csv, quotes_every_field_and_doubles_quotes) {
  auto entry = hexref::schema::activity_log_entry_t{};
  entry.id = "0A1B2C3S";
  entry.type = hexref::schema::procedure_type_t::s;
  entry.date = "2024-01-15";
  entry.jurisdiction = "CH \"BL\"";
  entry.channel = "WEB,MAIL";
  entry.created_at = "2024-03-10T12:34:56.789Z";

  auto second = entry;
  second.id = "FFFFFFFC";
  second.type = hexref::schema::procedure_type_t::c;
  second.jurisdiction = "";

  auto csv = hexref::exporting::to_csv({entry, second});
  EXPECT_EQ(csv,
            "\"id\",\"type\",\"date\",\"juridiction\",\"canal\",\"createdAt\"\n"
            "\"0A1B2C3S\",\"S\",\"2024-01-15\",\"CH \"\"BL\"\"\",\"WEB,MAIL\","
            "\"2024-03-10T12:34:56.789Z\"\n"
            "\"FFFFFFFC\",\"C\",\"2024-01-15\",\"\",\"WEB,MAIL\","
            "\"2024-03-10T12:34:56.789Z\"");
}

TEST(history_csv, quote_csv_field_handles_edge_cases) {
  EXPECT_EQ(hexref::exporting::quote_csv_field(""), "\"\"");
  EXPECT_EQ(hexref::exporting::quote_csv_field("\""), "\"\"\"\"");
  EXPECT_EQ(hexref::exporting::quote_csv_field("a\nb"), "\"a\nb\"");
}

TEST(history_csv, export_filename_carries_date) {
  EXPECT_EQ(hexref::exporting::make_export_filename("2024-01-15"),
            "hexref_history_2024-01-15.csv");
}
