#include <gtest/gtest.h>
#include <hexref/codec/identifier.hpp>

using hexref::schema::procedure_type_t;

TEST(identifier, is_valid_id_accepts_only_the_output_format) {
  EXPECT_TRUE(hexref::codec::is_valid_id("012E9DDM"));
  EXPECT_TRUE(hexref::codec::is_valid_id("ABCDEF0A"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012e9ddM"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012E9DDX"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012E9DM"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012E9DDMM"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012G9DDM"));
  EXPECT_FALSE(hexref::codec::is_valid_id("012-9DDM"));
  EXPECT_FALSE(hexref::codec::is_valid_id(""));
}

TEST(identifier, derive_id_takes_seven_digits_and_type_symbol) {
  EXPECT_EQ(hexref::codec::derive_id("012e9dd4a1b2c3", procedure_type_t::m),
            "012E9DDM");
  EXPECT_EQ(hexref::codec::derive_id(
                "B0344C61D8DB38535CA8AFCEAF0BF12B881DC200C9833DA726E9376C2E32CFF7",
                procedure_type_t::a),
            "B0344C6A");
}

TEST(identifier, try_derive_id_rejects_non_hex_or_short_digests) {
  EXPECT_FALSE(hexref::codec::try_derive_id("012345", procedure_type_t::c));
  EXPECT_FALSE(hexref::codec::try_derive_id("XYZ1234", procedure_type_t::c));
  EXPECT_TRUE(hexref::codec::try_derive_id("1234567", procedure_type_t::c));
}

TEST(identifier, type_of_reads_trailing_symbol) {
  EXPECT_EQ(hexref::codec::type_of("012E9DDS"), procedure_type_t::s);
  EXPECT_FALSE(hexref::codec::type_of("012E9DD"));
}
