#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/execution/engine.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/local_router.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <conduit/testing/common.hpp>
#include <conduit/testing/execution_harness.hpp>

#include <map>
#include <string>
#include <string_view>

namespace conduit::testing {

inline constexpr auto kTestChainName = std::string_view{"conduit-test"};
inline constexpr auto kLocalChain = conduit::schema::chain_selector_t{1};
inline constexpr auto kRemoteChain = conduit::schema::chain_selector_t{7};

inline conduit::dispatch::dispatch_table make_sealed_table() {
  auto table = conduit::dispatch::dispatch_table{};
  conduit::facets::cross_chain_mint::register_functions(table);
  table.seal();
  return table;
}

/// Engine over a throwaway RocksDB directory, wired to a local router that
/// reaches kRemoteChain with fee = 10 + 1 per payload byte.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false,
                             const bool install_allow_all_verifier = true)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{conduit::storage::make_storage<
            conduit::storage::rocksdb_storage_tag>(db_path_)},
        router_{encoder_,
                conduit::relay::fee_schedule{.base_fee = 10,
                                             .per_byte_fee = 1},
                {kRemoteChain}},
        table_{make_sealed_table()},
        engine_{encoder_, storage_, router_, table_, kTestChainName,
                strict_crypto} {
    if (install_allow_all_verifier) {
      engine_.set_signature_verifier(allow_all_verifier());
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  conduit::execution::engine& engine() { return engine_; }

  static conduit::schema::signer_id_t admin_signer() {
    return make_named_signer(0xA1);
  }
  static conduit::schema::signer_id_t router_signer() {
    return make_named_signer(0xB2);
  }
  static conduit::schema::signer_id_t user_signer() {
    return make_named_signer(0xC3);
  }
  static conduit::schema::address_t unit_address() {
    return make_address(0x50);
  }

  /// Initializer arguments: admin and router from the signers above, and a
  /// native balance of `native_balance` held by the unit itself.
  static conduit::schema::initialize_t initialize_args(
      const conduit::schema::amount_t& native_balance = 1'000'000) {
    auto args = conduit::schema::initialize_t{};
    args.name = "conduit";
    args.symbol = "CDT";
    args.base_uri = "ipfs://conduit/";
    args.router = address_of(router_signer());
    args.self = unit_address();
    args.local_chain_selector = kLocalChain;
    args.gas_limit = 300'000;
    args.admins = {address_of(admin_signer())};
    if (native_balance > 0) {
      args.allocations.push_back(conduit::schema::genesis_allocation_t{
          .asset = conduit::schema::kNativeAsset,
          .owner = unit_address(),
          .amount = native_balance});
    }
    return args;
  }

  conduit::schema::transaction_result_t provision(
      const conduit::schema::amount_t& native_balance = 1'000'000) {
    return engine_.initialize(initialize_args(native_balance));
  }

  /// Executes `payload` in its own block with the signer's next nonce.
  conduit::schema::transaction_result_t submit(
      const conduit::schema::signer_id_t& signer,
      const conduit::schema::transaction_payload_t& payload) {
    auto key = encoder_.encode(signer);
    auto& nonce = nonces_[key];
    auto tx = make_transaction(chain_id(), nonce + 1, signer, payload);
    auto result = finalize_single(engine_, ++height_, tx);
    if (result.code == 0) {
      ++nonce;
    }
    return result;
  }

  conduit::schema::hash32_t chain_id() {
    return conduit::execution::make_chain_id(kTestChainName);
  }

  uint64_t height() const { return height_; }

  static conduit::execution::signature_verifier_t allow_all_verifier() {
    return [](const conduit::schema::bytes_view_t&,
              const conduit::schema::signer_id_t&,
              const conduit::schema::signature_t&) { return true; };
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  conduit::storage::storage<conduit::storage::rocksdb_storage_tag> storage_;
  conduit::relay::local_router router_;
  conduit::dispatch::dispatch_table table_;
  conduit::execution::engine engine_;
  std::map<conduit::schema::bytes_t, uint64_t> nonces_;
  uint64_t height_{0};
};

}  // namespace conduit::testing
