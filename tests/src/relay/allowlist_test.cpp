#include <conduit/relay/allowlist.hpp>
#include <conduit/relay/router_registry.hpp>
#include <conduit/testing/relay_fixture.hpp>
#include <gtest/gtest.h>

namespace {

using conduit::schema::transaction_error_code;
using conduit::testing::make_address;
using conduit::testing::relay_fixture;

uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(allowlist, entries_start_disallowed) {
  auto fixture = relay_fixture{"conduit_allowlist_empty"};
  auto allowed = conduit::relay::allowlist{fixture.ctx()};
  EXPECT_FALSE(allowed.is_destination_allowed(7));
  EXPECT_FALSE(allowed.is_source_allowed(7));
  EXPECT_FALSE(allowed.is_sender_allowed(7, relay_fixture::remote_sender()));
}

TEST(allowlist, admin_sets_and_clears_destination) {
  auto fixture = relay_fixture{"conduit_allowlist_destination"};
  auto allowed = conduit::relay::allowlist{fixture.ctx()};

  auto set = allowed.set_destination_allowed(relay_fixture::admin(), 7, true);
  ASSERT_EQ(set.code, 0u);
  EXPECT_TRUE(allowed.is_destination_allowed(7));
  EXPECT_FALSE(allowed.is_destination_allowed(9));
  ASSERT_EQ(set.events.size(), 1u);
  EXPECT_EQ(set.events[0].type, "allowlist_updated");

  ASSERT_EQ(
      allowed.set_destination_allowed(relay_fixture::admin(), 7, false).code,
      0u);
  EXPECT_FALSE(allowed.is_destination_allowed(7));
}

TEST(allowlist, repeated_updates_are_idempotent) {
  auto fixture = relay_fixture{"conduit_allowlist_idempotent"};
  auto allowed = conduit::relay::allowlist{fixture.ctx()};

  EXPECT_EQ(allowed.set_source_allowed(relay_fixture::admin(), 3, true).code,
            0u);
  EXPECT_EQ(allowed.set_source_allowed(relay_fixture::admin(), 3, true).code,
            0u);
  EXPECT_TRUE(allowed.is_source_allowed(3));

  EXPECT_EQ(allowed.set_source_allowed(relay_fixture::admin(), 4, false).code,
            0u);
  EXPECT_FALSE(allowed.is_source_allowed(4));
}

TEST(allowlist, non_admin_updates_are_unauthorized) {
  auto fixture = relay_fixture{"conduit_allowlist_unauthorized"};
  auto allowed = conduit::relay::allowlist{fixture.ctx()};
  const auto stranger = relay_fixture::stranger();

  EXPECT_EQ(allowed.set_destination_allowed(stranger, 7, true).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(allowed.set_source_allowed(stranger, 7, true).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(allowed
                .set_sender_allowed(stranger, 7, relay_fixture::remote_sender(),
                                    true)
                .code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_FALSE(allowed.is_destination_allowed(7));
  EXPECT_FALSE(allowed.is_source_allowed(7));
}

TEST(allowlist, sender_entries_are_scoped_per_source_chain) {
  auto fixture = relay_fixture{"conduit_allowlist_sender_scope"};
  auto allowed = conduit::relay::allowlist{fixture.ctx()};
  const auto sender = relay_fixture::remote_sender();

  ASSERT_EQ(
      allowed.set_sender_allowed(relay_fixture::admin(), 7, sender, true).code,
      0u);
  EXPECT_TRUE(allowed.is_sender_allowed(7, sender));
  EXPECT_FALSE(allowed.is_sender_allowed(8, sender));
  EXPECT_FALSE(allowed.is_sender_allowed(7, make_address(0xE0)));
}

TEST(router_registry, admin_replaces_router_and_rejects_zero) {
  auto fixture = relay_fixture{"conduit_router_registry"};
  auto registry = conduit::relay::router_registry{fixture.ctx()};
  ASSERT_EQ(registry.current(),
            std::optional<conduit::schema::address_t>{relay_fixture::router()});

  auto replacement = make_address(0xB8);
  EXPECT_EQ(registry.set(relay_fixture::stranger(), replacement).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(registry.set(relay_fixture::admin(), conduit::schema::address_t{})
                .code,
            code_of(transaction_error_code::invalid_argument));

  auto result = registry.set(relay_fixture::admin(), replacement);
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(registry.current(),
            std::optional<conduit::schema::address_t>{replacement});
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "router_updated");
}
