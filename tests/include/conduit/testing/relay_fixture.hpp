#pragma once

#include <gtest/gtest.h>

#include <conduit/access/access_control.hpp>
#include <conduit/assets/ledger.hpp>
#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/allowlist.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/relay/context.hpp>
#include <conduit/relay/router_registry.hpp>
#include <conduit/storage/overlay.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <conduit/testing/common.hpp>

#include <string>
#include <string_view>

namespace conduit::testing {

/// Relay context over an overlay on a throwaway RocksDB directory. The admin
/// role and the router are registered up front; allowlists start empty.
class relay_fixture final {
 public:
  explicit relay_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{conduit::storage::make_storage<
            conduit::storage::rocksdb_storage_tag>(db_path_)},
        state_{storage_},
        unit_{make_unit()},
        ctx_{.encoder = encoder_, .state = state_, .unit = unit_, .height = 5} {
    conduit::facets::cross_chain_mint::register_functions(table_);
    table_.seal();
    conduit::access::access_control{encoder_, state_}.grant(
        conduit::schema::role_id_t::admin, admin());
    conduit::relay::router_registry{ctx_}.initialize(router());
  }

  relay_fixture(const relay_fixture&) = delete;
  relay_fixture& operator=(const relay_fixture&) = delete;

  ~relay_fixture() { remove_path(db_path_); }

  static conduit::schema::address_t admin() { return make_address(0xA0); }
  static conduit::schema::address_t router() { return make_address(0xB0); }
  static conduit::schema::address_t stranger() { return make_address(0xC0); }
  static conduit::schema::address_t self() { return make_address(0x50); }
  static conduit::schema::address_t remote_sender() {
    return make_address(0xD0);
  }

  conduit::relay::context& ctx() { return ctx_; }
  conduit::storage::overlay& state() { return state_; }
  scale_encoder_t& encoder() { return encoder_; }
  const conduit::dispatch::dispatch_table& table() const { return table_; }

  void allow_destination(const conduit::schema::chain_selector_t chain) {
    EXPECT_EQ(conduit::relay::allowlist{ctx_}
                  .set_destination_allowed(admin(), chain, true)
                  .code,
              0u);
  }

  void allow_source_sender(const conduit::schema::chain_selector_t chain,
                           const conduit::schema::address_t& sender) {
    auto allowed = conduit::relay::allowlist{ctx_};
    EXPECT_EQ(allowed.set_source_allowed(admin(), chain, true).code, 0u);
    EXPECT_EQ(allowed.set_sender_allowed(admin(), chain, sender, true).code,
              0u);
  }

  void fund(const conduit::schema::address_t& asset,
            const conduit::schema::amount_t& amount) {
    EXPECT_TRUE(
        conduit::assets::ledger{encoder_, state_}.mint(asset, self(), amount));
  }

  conduit::schema::amount_t balance(const conduit::schema::address_t& asset,
                                    const conduit::schema::address_t& owner) {
    return conduit::assets::ledger{encoder_, state_}.balance_of(asset, owner);
  }

  static conduit::schema::bytes_t make_inbound(
      const conduit::schema::message_id_t& message_id,
      const conduit::schema::chain_selector_t source,
      const conduit::schema::address_t& sender,
      conduit::schema::bytes_t data) {
    auto message = conduit::schema::inbound_message_t{};
    message.message_id = message_id;
    message.source_chain_selector = source;
    message.sender = conduit::schema::make_bytes(sender);
    message.data = std::move(data);
    return conduit::relay::codec::encode_inbound(message);
  }

 private:
  conduit::schema::unit_info_t make_unit() {
    auto unit = conduit::schema::unit_info_t{};
    unit.name = "conduit";
    unit.symbol = "CDT";
    unit.base_uri = "ipfs://conduit/";
    unit.self = self();
    unit.local_chain_selector = 1;
    unit.gas_limit = conduit::schema::kDefaultGasLimit;
    return unit;
  }

  std::string db_path_;
  scale_encoder_t encoder_;
  conduit::storage::storage<conduit::storage::rocksdb_storage_tag> storage_;
  conduit::storage::overlay state_;
  conduit::schema::unit_info_t unit_;
  conduit::dispatch::dispatch_table table_;
  conduit::relay::context ctx_;
};

}  // namespace conduit::testing
