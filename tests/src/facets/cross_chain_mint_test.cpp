#include <conduit/common/result.hpp>
#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/testing/execution_harness.hpp>
#include <conduit/testing/relay_fixture.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace {

namespace mint_facet = conduit::facets::cross_chain_mint;

using conduit::schema::transaction_error_code;
using conduit::testing::make_address;
using conduit::testing::make_hash;
using conduit::testing::relay_fixture;
using conduit::testing::view;

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

struct sent_call final {
  conduit::schema::address_t caller{};
  conduit::schema::chain_selector_t destination{};
  conduit::schema::address_t receiver{};
  conduit::schema::bytes_t data;
};

/// Stands in for the outbound path: records each call and answers with
/// `reply`, or a message id when `reply` carries no error.
struct sender_double final {
  std::vector<sent_call> calls;
  conduit::schema::transaction_result_t reply;

  conduit::dispatch::message_sender_t bind() {
    return [this](const conduit::schema::address_t& caller,
                  const conduit::schema::chain_selector_t destination,
                  const conduit::schema::address_t& receiver,
                  conduit::schema::bytes_t data) {
      calls.push_back(sent_call{.caller = caller,
                                .destination = destination,
                                .receiver = receiver,
                                .data = std::move(data)});
      auto result = reply;
      if (result.code == 0) {
        const auto id = make_hash(0x70);
        result.data = conduit::schema::bytes_t{std::begin(id), std::end(id)};
        result.events.push_back(conduit::common::make_event(
            "message_sent", {{"destination_chain_selector",
                              std::to_string(destination)}}));
      }
      return result;
    };
  }
};

conduit::dispatch::facet_context make_facet(
    relay_fixture& fixture,
    const conduit::schema::address_t& caller,
    conduit::dispatch::message_sender_t sender = {}) {
  return conduit::dispatch::facet_context{.caller = caller,
                                          .self = relay_fixture::self(),
                                          .height = 5,
                                          .state = fixture.state(),
                                          .encoder = fixture.encoder(),
                                          .send_message = std::move(sender)};
}

void mint_to(relay_fixture& fixture,
             const conduit::schema::address_t& owner,
             const conduit::schema::amount_t& token_id) {
  auto self = make_facet(fixture, relay_fixture::self());
  auto call = mint_facet::make_mint_call(owner, token_id);
  ASSERT_EQ(fixture.table().dispatch(self, view(call)).code, 0u);
}

}  // namespace

TEST(cross_chain_mint, burn_and_mint_sends_mint_for_the_burned_token) {
  auto fixture = relay_fixture{"conduit_facet_bridge"};
  const auto owner = make_address(0x30);
  const auto receiver = make_address(0x61);
  const auto to = make_address(0x31);
  mint_to(fixture, owner, 4);

  auto sender = sender_double{};
  auto holder = make_facet(fixture, owner, sender.bind());
  auto call = mint_facet::make_burn_and_mint_call(7, receiver, to, 4);
  auto result = fixture.table().dispatch(holder, view(call));
  ASSERT_EQ(result.code, 0u) << result.info;

  EXPECT_FALSE(
      mint_facet::owner_of(fixture.encoder(), fixture.state(), 4).has_value());
  ASSERT_EQ(sender.calls.size(), 1u);
  EXPECT_EQ(sender.calls[0].caller, owner);
  EXPECT_EQ(sender.calls[0].destination, 7u);
  EXPECT_EQ(sender.calls[0].receiver, receiver);
  EXPECT_EQ(sender.calls[0].data, mint_facet::make_mint_call(to, 4));

  EXPECT_EQ(result.data.size(), 32u);
  EXPECT_NE(conduit::testing::find_event(result, "token_burned"), nullptr);
  EXPECT_NE(conduit::testing::find_event(result, "message_sent"), nullptr);
  const auto* bridged = conduit::testing::find_event(result, "token_bridged");
  ASSERT_NE(bridged, nullptr);
  EXPECT_EQ(conduit::testing::event_attribute(*bridged, "to"),
            std::optional<std::string>{conduit::schema::to_hex(to)});
}

TEST(cross_chain_mint, burn_and_mint_requires_the_owner) {
  auto fixture = relay_fixture{"conduit_facet_bridge_owner"};
  mint_to(fixture, make_address(0x30), 4);

  auto sender = sender_double{};
  auto stranger = make_facet(fixture, relay_fixture::stranger(), sender.bind());
  auto call =
      mint_facet::make_burn_and_mint_call(7, make_address(0x61),
                                          make_address(0x31), 4);
  EXPECT_EQ(fixture.table().dispatch(stranger, view(call)).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_TRUE(sender.calls.empty());

  auto missing =
      mint_facet::make_burn_and_mint_call(7, make_address(0x61),
                                          make_address(0x31), 5);
  EXPECT_EQ(fixture.table().dispatch(stranger, view(missing)).code,
            code_of(transaction_error_code::facet_call_failed));

  auto zero = mint_facet::make_burn_and_mint_call(
      7, make_address(0x61), conduit::schema::address_t{}, 4);
  auto holder = make_facet(fixture, make_address(0x30), sender.bind());
  EXPECT_EQ(fixture.table().dispatch(holder, view(zero)).code,
            code_of(transaction_error_code::invalid_argument));
  EXPECT_TRUE(sender.calls.empty());
}

TEST(cross_chain_mint, burn_and_mint_is_unavailable_without_a_sender) {
  auto fixture = relay_fixture{"conduit_facet_bridge_inbound"};
  mint_to(fixture, relay_fixture::self(), 4);

  // Inbound payloads run with the unit as caller and no sender.
  auto self = make_facet(fixture, relay_fixture::self());
  auto call =
      mint_facet::make_burn_and_mint_call(7, make_address(0x61),
                                          make_address(0x31), 4);
  EXPECT_EQ(fixture.table().dispatch(self, view(call)).code,
            code_of(transaction_error_code::facet_call_failed));
  EXPECT_EQ(mint_facet::owner_of(fixture.encoder(), fixture.state(), 4),
            std::optional<conduit::schema::address_t>{relay_fixture::self()});
}

TEST(cross_chain_mint, failed_send_reports_the_outbound_code) {
  auto fixture = relay_fixture{"conduit_facet_bridge_refused"};
  mint_to(fixture, make_address(0x30), 4);

  auto sender = sender_double{};
  sender.reply = conduit::common::make_error(
      transaction_error_code::destination_chain_not_allowlisted, "chain 7");
  auto holder = make_facet(fixture, make_address(0x30), sender.bind());
  auto call =
      mint_facet::make_burn_and_mint_call(7, make_address(0x61),
                                          make_address(0x31), 4);
  auto result = fixture.table().dispatch(holder, view(call));
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::destination_chain_not_allowlisted));
  EXPECT_EQ(sender.calls.size(), 1u);
}

TEST(cross_chain_mint, token_uri_appends_token_id_to_base_uri) {
  auto fixture = relay_fixture{"conduit_facet_token_uri"};
  EXPECT_FALSE(mint_facet::token_uri(fixture.encoder(), fixture.state(),
                                     fixture.ctx().unit, 12)
                   .has_value());

  mint_to(fixture, make_address(0x30), 12);
  EXPECT_EQ(mint_facet::token_uri(fixture.encoder(), fixture.state(),
                                  fixture.ctx().unit, 12),
            std::optional<std::string>{"ipfs://conduit/12"});
}
