#include <gtest/gtest.h>
#include <hexref/schema/primitives.hpp>
#include <hexref/schema/procedure_type.hpp>

TEST(primitives, to_upper_hex_renders_two_digits_per_byte) {
  auto bytes = hexref::schema::bytes_t{0x00, 0x0A, 0xBC, 0xFF};
  EXPECT_EQ(hexref::schema::to_upper_hex(bytes), "000ABCFF");
  EXPECT_EQ(hexref::schema::to_upper_hex(hexref::schema::bytes_t{}), "");
}

TEST(primitives, trim_strips_surrounding_whitespace_only) {
  EXPECT_EQ(hexref::schema::trim("  ch-bl\t\n"), "ch-bl");
  EXPECT_EQ(hexref::schema::trim("a b"), "a b");
  EXPECT_EQ(hexref::schema::trim("   "), "");
}

TEST(primitives, to_upper_leaves_non_letters_alone) {
  EXPECT_EQ(hexref::schema::to_upper("ch-bl_9"), "CH-BL_9");
}

TEST(primitives, make_string_round_trips_through_bytes) {
  auto bytes = hexref::schema::make_bytes(std::string_view{"SYS|STATE|"});
  EXPECT_EQ(hexref::schema::make_string(bytes), "SYS|STATE|");
  EXPECT_EQ(hexref::schema::make_string_view(bytes), "SYS|STATE|");
}

TEST(procedure_type, parses_only_uppercase_symbols) {
  using hexref::schema::procedure_type_t;
  EXPECT_EQ(hexref::schema::try_parse_procedure_type("C"),
            procedure_type_t::c);
  EXPECT_EQ(hexref::schema::try_parse_procedure_type("A"),
            procedure_type_t::a);
  EXPECT_FALSE(hexref::schema::try_parse_procedure_type("m"));
  EXPECT_FALSE(hexref::schema::try_parse_procedure_type("X"));
  EXPECT_FALSE(hexref::schema::try_parse_procedure_type("MM"));
  EXPECT_EQ(hexref::schema::to_symbol(procedure_type_t::s), 'S');
  EXPECT_EQ(hexref::schema::to_string(procedure_type_t::i), "I");
}
