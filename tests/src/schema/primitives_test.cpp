#include <gtest/gtest.h>
#include <herald/schema/primitives.hpp>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = herald::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_input) {
  EXPECT_FALSE(herald::schema::try_make_hash32(std::string_view{"0102"}));
}

TEST(primitives, hex_rendering_respects_case) {
  auto bytes = herald::schema::bytes_t{0x0A, 0xBC, 0xFF};
  EXPECT_EQ(herald::schema::to_hex(bytes), "0abcff");
  EXPECT_EQ(herald::schema::to_upper_hex(bytes), "0ABCFF");
  EXPECT_EQ(herald::schema::from_hex("0ABCff"), bytes);
}

TEST(primitives, base64_decodes_padded_input) {
  EXPECT_EQ(herald::schema::to_base64(herald::schema::bytes_t{0x01}), "AQ==");
  EXPECT_EQ(herald::schema::from_base64("AQ=="), herald::schema::bytes_t{0x01});
  EXPECT_EQ(herald::schema::from_base64("AQI="),
            (herald::schema::bytes_t{0x01, 0x02}));
  EXPECT_EQ(herald::schema::from_base64("AQID"),
            (herald::schema::bytes_t{0x01, 0x02, 0x03}));
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(herald::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(herald::schema::try_from_base64("A=QI").has_value());
  EXPECT_FALSE(herald::schema::try_from_base64("AQ==AQID").has_value());
}
