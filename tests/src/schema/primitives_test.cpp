#include <gtest/gtest.h>
#include <conduit/schema/primitives.hpp>

#include <limits>

TEST(primitives, make_hash32_from_bytes_copies_prefix) {
  auto input = conduit::schema::bytes_t(32, 0xAB);
  auto hash = conduit::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = conduit::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_input) {
  EXPECT_FALSE(conduit::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(conduit::schema::try_make_hash32("zz").has_value());
}

TEST(primitives, make_zero_hash_is_zero) {
  auto zero = conduit::schema::make_zero_hash();
  EXPECT_TRUE(conduit::schema::is_zero(zero));
  zero[7] = 1;
  EXPECT_FALSE(conduit::schema::is_zero(zero));
}

TEST(primitives, try_from_hex_accepts_prefix_and_mixed_case) {
  auto decoded = conduit::schema::try_from_hex("0xDEadBEef");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (conduit::schema::bytes_t{0xDE, 0xAD, 0xBE, 0xEF}));
  EXPECT_EQ(conduit::schema::to_hex(conduit::schema::make_bytes_view(*decoded)),
            "deadbeef");
}

TEST(primitives, try_from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(conduit::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(conduit::schema::try_from_hex("0xgg").has_value());
}

TEST(primitives, try_make_address_requires_twenty_bytes) {
  auto address = conduit::schema::try_make_address(
      std::string_view{"0x00112233445566778899aabbccddeeff00112233"});
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ((*address)[1], 0x11);
  EXPECT_EQ(conduit::schema::to_hex(*address),
            "00112233445566778899aabbccddeeff00112233");

  EXPECT_FALSE(conduit::schema::try_make_address(std::string_view{"0x0011"})
                   .has_value());
}

TEST(primitives, native_asset_is_the_zero_address) {
  EXPECT_TRUE(conduit::schema::is_zero(conduit::schema::kNativeAsset));
  auto address = conduit::schema::address_t{};
  address[19] = 1;
  EXPECT_FALSE(conduit::schema::is_zero(address));
}

TEST(primitives, base64_encodes_known_vectors) {
  EXPECT_EQ(conduit::schema::to_base64(
                conduit::schema::make_bytes_view(std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(conduit::schema::to_base64(
                conduit::schema::make_bytes_view(std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(conduit::schema::to_base64(
                conduit::schema::make_bytes_view(std::string_view{"foobar"})),
            "Zm9vYmFy");
}

TEST(primitives, base64_decodes_padded_input) {
  auto payload = conduit::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded =
      conduit::schema::to_base64(conduit::schema::make_bytes_view(payload));
  auto decoded = conduit::schema::try_from_base64(encoded);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(conduit::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(conduit::schema::try_from_base64("Zg=a").has_value());
  EXPECT_FALSE(conduit::schema::try_from_base64("Zg=").has_value());
}

TEST(primitives, try_make_amount_parses_full_uint256_range) {
  auto max = conduit::schema::try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639935");
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(*max, std::numeric_limits<conduit::schema::amount_t>::max());

  auto overflow = conduit::schema::try_make_amount(
      "115792089237316195423570985008687907853269984665640564039457584007913"
      "129639936");
  EXPECT_FALSE(overflow.has_value());
}

TEST(primitives, try_make_amount_rejects_non_decimal) {
  EXPECT_FALSE(conduit::schema::try_make_amount("").has_value());
  EXPECT_FALSE(conduit::schema::try_make_amount("-1").has_value());
  EXPECT_FALSE(conduit::schema::try_make_amount("0x10").has_value());
  EXPECT_EQ(conduit::schema::to_string(*conduit::schema::try_make_amount("42")),
            "42");
}
