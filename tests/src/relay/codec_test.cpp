#include <conduit/blake3/hash.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using conduit::testing::make_address;
using conduit::testing::make_hash;
using conduit::testing::view;

conduit::schema::inbound_message_t make_message() {
  auto message = conduit::schema::inbound_message_t{};
  message.message_id = make_hash(0x11);
  message.source_chain_selector = 7;
  message.sender = conduit::schema::make_bytes(make_address(0xD0));
  message.data = conduit::facets::cross_chain_mint::make_mint_call(
      make_address(0x30), 5);
  return message;
}

std::string decode_error(const conduit::schema::bytes_t& raw) {
  auto error = std::string{};
  EXPECT_FALSE(conduit::relay::codec::decode(view(raw), error).has_value());
  return error;
}

}  // namespace

TEST(codec, encode_attaches_one_token_amount_and_tagged_extra_args) {
  auto message = conduit::relay::codec::encode(
      make_address(0x01), {0xAA, 0xBB}, conduit::schema::kNativeAsset, 0,
      make_address(0x02), 123'000);

  EXPECT_EQ(message.receiver, conduit::schema::make_bytes(make_address(0x01)));
  EXPECT_EQ(message.data, (conduit::schema::bytes_t{0xAA, 0xBB}));
  ASSERT_EQ(message.token_amounts.size(), 1u);
  EXPECT_EQ(message.token_amounts[0].amount, 0);
  EXPECT_EQ(message.fee_token, make_address(0x02));

  ASSERT_GE(message.extra_args.size(), conduit::schema::kExtraArgsV1Tag.size());
  EXPECT_TRUE(std::equal(std::begin(conduit::schema::kExtraArgsV1Tag),
                         std::end(conduit::schema::kExtraArgsV1Tag),
                         std::begin(message.extra_args)));
  auto args =
      conduit::relay::codec::decode_extra_args(view(message.extra_args));
  ASSERT_TRUE(args.has_value());
  EXPECT_EQ(args->gas_limit, 123'000u);
}

TEST(codec, decode_extra_args_rejects_missing_tag) {
  auto raw = conduit::schema::bytes_t{0x00, 0x01, 0x02, 0x03, 0x04};
  EXPECT_FALSE(conduit::relay::codec::decode_extra_args(view(raw)).has_value());
}

TEST(codec, decode_accepts_canonical_message) {
  auto expected = make_message();
  auto raw = conduit::relay::codec::encode_inbound(expected);

  auto error = std::string{};
  auto decoded = conduit::relay::codec::decode(view(raw), error);
  ASSERT_TRUE(decoded.has_value()) << error;
  EXPECT_EQ(decoded->message_id, expected.message_id);
  EXPECT_EQ(decoded->source_chain_selector, 7u);
  EXPECT_EQ(decoded->sender, expected.sender);
  EXPECT_EQ(decoded->data, expected.data);
}

TEST(codec, decode_rejects_empty_and_truncated_input) {
  EXPECT_EQ(decode_error({}), "empty message");

  auto raw = conduit::relay::codec::encode_inbound(make_message());
  raw.resize(raw.size() / 2);
  EXPECT_FALSE(decode_error(raw).empty());
}

TEST(codec, decode_rejects_trailing_bytes) {
  auto raw = conduit::relay::codec::encode_inbound(make_message());
  raw.push_back(0x00);
  // Rejected either by the codec or by the canonical re-encode check.
  EXPECT_FALSE(decode_error(raw).empty());
}

TEST(codec, decode_rejects_unknown_version) {
  auto message = make_message();
  message.version = 2;
  EXPECT_EQ(decode_error(conduit::relay::codec::encode_inbound(message)),
            "unsupported message version 2");
}

TEST(codec, decode_rejects_short_sender) {
  auto message = make_message();
  message.sender = {0x01, 0x02};
  EXPECT_EQ(decode_error(conduit::relay::codec::encode_inbound(message)),
            "sender must be 20 bytes");
}

TEST(codec, decode_rejects_multiple_or_malformed_token_amounts) {
  auto message = make_message();
  auto token = conduit::schema::token_amount_t{
      .token = conduit::schema::make_bytes(make_address(0x40)), .amount = 1};
  message.token_amounts = {token, token};
  EXPECT_EQ(decode_error(conduit::relay::codec::encode_inbound(message)),
            "at most one token amount is accepted");

  token.token = {0x01};
  message.token_amounts = {token};
  EXPECT_EQ(decode_error(conduit::relay::codec::encode_inbound(message)),
            "token must be 20 bytes");
}

TEST(codec, decode_rejects_call_data_without_selector) {
  auto message = make_message();
  message.data = {0x01, 0x02, 0x03};
  EXPECT_EQ(decode_error(conduit::relay::codec::encode_inbound(message)),
            "call data shorter than a selector");
}

TEST(codec, split_call_data_separates_selector_from_arguments) {
  auto selector = conduit::blake3::selector("burn(uint256)");
  auto data = conduit::relay::codec::make_call_data(selector, {0x09, 0x08});

  auto split = conduit::relay::codec::split_call_data(view(data));
  ASSERT_TRUE(split.has_value());
  EXPECT_EQ(split->selector, selector);
  ASSERT_EQ(split->arguments.size(), 2u);
  EXPECT_EQ(split->arguments[0], 0x09);

  auto short_data = conduit::schema::bytes_t{0x01, 0x02};
  EXPECT_FALSE(
      conduit::relay::codec::split_call_data(view(short_data)).has_value());
}
