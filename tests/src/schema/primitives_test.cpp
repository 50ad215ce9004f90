#include <gtest/gtest.h>
#include <invoicer/schema/primitives.hpp>

#include <limits>
#include <string>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = invoicer::schema::bytes_t(32, 0xAB);
  auto hash = invoicer::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = invoicer::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_and_non_hex_input) {
  EXPECT_FALSE(invoicer::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(invoicer::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_TRUE(invoicer::schema::try_make_hash32(std::string(64, 'F')).has_value());
}

TEST(primitives, make_zero_hash_is_the_null_identity) {
  auto zero = invoicer::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
  EXPECT_TRUE(invoicer::schema::is_zero(zero));

  zero[17] = 1;
  EXPECT_FALSE(invoicer::schema::is_zero(zero));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = invoicer::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = invoicer::schema::to_hex(invoicer::schema::make_bytes_view(payload));
  EXPECT_EQ(encoded, "010203feff");
  auto decoded = invoicer::schema::try_from_hex(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
  EXPECT_FALSE(invoicer::schema::try_from_hex("abc").has_value());
}

TEST(primitives, try_parse_amount_accepts_decimal_digits_only) {
  auto parsed = invoicer::schema::try_parse_amount("1250");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, invoicer::schema::amount_t{1250});

  EXPECT_FALSE(invoicer::schema::try_parse_amount("").has_value());
  EXPECT_FALSE(invoicer::schema::try_parse_amount("-5").has_value());
  EXPECT_FALSE(invoicer::schema::try_parse_amount("12.5").has_value());
}

TEST(primitives, try_parse_amount_rejects_values_beyond_256_bits) {
  // 2^256 - 1
  auto maximum = std::string{
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935"};
  auto parsed = invoicer::schema::try_parse_amount(maximum);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, std::numeric_limits<invoicer::schema::amount_t>::max());

  maximum.back() = '6';
  EXPECT_FALSE(invoicer::schema::try_parse_amount(maximum).has_value());
}
