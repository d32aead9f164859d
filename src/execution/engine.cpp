#include <spdlog/spdlog.h>
#include <conduit/access/access_control.hpp>
#include <conduit/assets/ledger.hpp>
#include <conduit/blake3/hash.hpp>
#include <conduit/common/result.hpp>
#include <conduit/crypto/verify.hpp>
#include <conduit/execution/engine.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/allowlist.hpp>
#include <conduit/relay/context.hpp>
#include <conduit/relay/failure_ledger.hpp>
#include <conduit/relay/inbound.hpp>
#include <conduit/relay/local_router.hpp>
#include <conduit/relay/outbound.hpp>
#include <conduit/relay/recovery.hpp>
#include <conduit/relay/router_registry.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <conduit/schema/query_error_code.hpp>
#include <exception>
#include <tuple>
#include <utility>

using namespace conduit::schema;

namespace {

conduit::schema::hash32_t fold_state_root(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::schema::hash32_t& seed,
    const conduit::schema::bytes_t& material_tail,
    uint64_t height,
    uint64_t index) {
  auto material = conduit::schema::bytes_t{};
  material.reserve(seed.size() + material_tail.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(material_tail),
                  std::end(material_tail));
  encoder.encode(std::tuple{height, index}, material);
  return conduit::blake3::hash(
      conduit::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<conduit::schema::transaction_t> decode_transaction(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<conduit::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction is not valid SCALE";
  }
  return tx;
}

bool signature_matches_signer(const conduit::schema::signer_id_t& signer,
                              const conduit::schema::signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id&) {
                   return std::holds_alternative<ed25519_signature_t>(
                       signature);
                 },
                 [&](const secp256k1_signer_id&) {
                   return std::holds_alternative<secp256k1_signature_t>(
                       signature);
                 },
                 [](const named_signer_t&) { return true; }},
      signer);
}

query_result_t make_query_error(const query_error_code code,
                                std::string info,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{conduit::common::kQueryCodespace};
  return result;
}

}  // namespace

namespace conduit::execution {

conduit::schema::bytes_t make_signing_bytes(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

conduit::schema::hash32_t make_chain_id(const std::string_view chain_name) {
  return conduit::blake3::hash(chain_name);
}

engine::engine(
    conduit::schema::encoding::scale_encoder_t& encoder,
    conduit::storage::storage<conduit::storage::rocksdb_storage_tag>& storage,
    conduit::relay::router& router,
    const conduit::dispatch::dispatch_table& table,
    const std::string_view chain_name,
    const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      router_{router},
      table_{table},
      chain_id_{make_chain_id(chain_name)},
      require_strict_crypto_{require_strict_crypto} {
  auto lock = std::scoped_lock{mutex_};
  if (!table_.sealed()) {
    conduit::common::critical("dispatch table must be sealed before use");
  }
  load_persisted_state();
  if (require_strict_crypto_ && !conduit::crypto::available()) {
    spdlog::warn("Strict crypto requested but OpenSSL backend unavailable");
  }
  spdlog::info("Execution engine ready for chain '{}' at height {}",
               chain_name, last_committed_height_);
}

conduit::schema::transaction_result_t engine::initialize(
    const conduit::schema::initialize_t& args) {
  auto lock = std::scoped_lock{mutex_};
  auto state = conduit::storage::overlay{storage_};
  if (load_unit(state)) {
    return conduit::common::make_error(
        transaction_error_code::already_initialized,
        "unit has already been provisioned");
  }
  if (is_zero(args.self)) {
    return conduit::common::make_error(transaction_error_code::invalid_argument,
                                       "unit address must be non-zero");
  }

  auto unit = unit_info_t{};
  unit.name = args.name;
  unit.symbol = args.symbol;
  unit.base_uri = args.base_uri;
  unit.fee_token = args.fee_token;
  unit.self = args.self;
  unit.local_chain_selector = args.local_chain_selector;
  unit.gas_limit = args.gas_limit == 0 ? kDefaultGasLimit : args.gas_limit;
  state.put(encoder_, key::make_unit_key(encoder_), unit);

  auto ctx = conduit::relay::context{
      .encoder = encoder_, .state = state, .unit = unit, .height = 0};
  conduit::relay::router_registry{ctx}.initialize(args.router);

  auto roles = conduit::access::access_control{encoder_, state};
  for (const auto& admin : args.admins) {
    roles.grant(role_id_t::admin, admin);
  }
  auto ledger = conduit::assets::ledger{encoder_, state};
  for (const auto& allocation : args.allocations) {
    if (!ledger.mint(allocation.asset, allocation.owner, allocation.amount)) {
      return conduit::common::make_error(
          transaction_error_code::invalid_argument,
          "allocation overflows balance of " + to_hex(allocation.owner));
    }
  }

  auto root = fold_state_root(encoder_, last_committed_state_root_,
                              encoder_.encode(args),
                              static_cast<uint64_t>(last_committed_height_), 0);
  storage_.commit(state.writes(),
                  conduit::storage::committed_state{
                      .height = last_committed_height_, .state_root = root});
  last_committed_state_root_ = root;
  pending_state_root_ = root;

  spdlog::info("Provisioned unit '{}' ({}) with {} admin(s), {} allocation(s)",
               unit.name, to_hex(unit.self), args.admins.size(),
               args.allocations.size());
  auto result = transaction_result_t{};
  result.info = "initialized";
  return result;
}

bool engine::initialized() const {
  auto lock = std::scoped_lock{mutex_};
  auto state = conduit::storage::overlay{storage_};
  return load_unit(state).has_value();
}

conduit::schema::transaction_result_t engine::check_transaction(
    const conduit::schema::bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return conduit::common::make_error(
        transaction_error_code::invalid_transaction, decode_error,
        conduit::common::kCheckCodespace);
  }
  auto state = conduit::storage::overlay{storage_};
  return validate_transaction(*maybe_tx, state,
                              conduit::common::kCheckCodespace);
}

conduit::schema::transaction_result_t engine::validate_transaction(
    const conduit::schema::transaction_t& tx,
    const conduit::storage::overlay& state,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return conduit::common::make_error(
        transaction_error_code::unsupported_transaction_version,
        "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return conduit::common::make_error(transaction_error_code::invalid_chain_id,
                                       "chain id mismatch", codespace);
  }

  auto last_nonce =
      state.get<uint64_t>(encoder_, key::make_nonce_key(encoder_, tx.signer))
          .value_or(0);
  if (tx.nonce != last_nonce + 1) {
    spdlog::debug("Nonce mismatch: expected {}, got {}", last_nonce + 1,
                  tx.nonce);
    return conduit::common::make_error(
        transaction_error_code::invalid_nonce,
        "expected nonce " + std::to_string(last_nonce + 1), codespace);
  }

  if (!signature_matches_signer(tx.signer, tx.signature)) {
    return conduit::common::make_error(
        transaction_error_code::invalid_signature_type,
        "signature type does not match signer type", codespace);
  }

  auto message = make_signing_bytes(encoder_, tx);
  auto message_view = bytes_view_t{message.data(), message.size()};
  auto verified = false;
  if (require_strict_crypto_) {
    if (std::holds_alternative<named_signer_t>(tx.signer)) {
      return conduit::common::make_error(
          transaction_error_code::invalid_signature_type,
          "named signers cannot be verified in strict mode", codespace);
    }
    verified =
        conduit::crypto::verify_signature(message_view, tx.signer, tx.signature);
  } else if (signature_verifier_) {
    verified = signature_verifier_(message_view, tx.signer, tx.signature);
  }
  if (!verified) {
    return conduit::common::make_error(
        transaction_error_code::signature_verification_failed,
        "signature rejected", codespace);
  }

  auto result = transaction_result_t{};
  result.gas_wanted = 1000;
  return result;
}

conduit::schema::transaction_result_t engine::execute_operation(
    const conduit::schema::transaction_t& tx,
    const conduit::schema::unit_info_t& unit,
    conduit::storage::overlay& state,
    const uint64_t height) {
  auto ctx = conduit::relay::context{
      .encoder = encoder_, .state = state, .unit = unit, .height = height};
  auto caller = conduit::crypto::derive_address(tx.signer);

  return std::visit(
      overloaded{
          [&](const send_message_t& request) {
            return conduit::relay::outbound{ctx, router_}.send(caller,
                                                               request);
          },
          [&](const receive_message_t& request) {
            return conduit::relay::inbound{ctx, table_}.receive(
                caller,
                bytes_view_t{request.message.data(), request.message.size()});
          },
          [&](const retry_failed_message_t& request) {
            return conduit::relay::recovery{ctx, table_}.retry_failed_message(
                caller, request);
          },
          [&](const set_destination_chain_t& request) {
            return conduit::relay::allowlist{ctx}.set_destination_allowed(
                caller, request.chain_selector, request.allowed);
          },
          [&](const set_source_chain_t& request) {
            return conduit::relay::allowlist{ctx}.set_source_allowed(
                caller, request.chain_selector, request.allowed);
          },
          [&](const set_sender_t& request) {
            return conduit::relay::allowlist{ctx}.set_sender_allowed(
                caller, request.chain_selector, request.sender,
                request.allowed);
          },
          [&](const set_router_t& request) {
            return conduit::relay::router_registry{ctx}.set(caller,
                                                            request.router);
          },
          [&](const upsert_role_assignment_t& request) {
            return conduit::access::access_control{encoder_, state}
                .upsert_role_assignment(caller, request);
          },
          [&](const call_facet_t& request) {
            auto facet = conduit::dispatch::facet_context{
                .caller = caller,
                .self = unit.self,
                .height = height,
                .state = state,
                .encoder = encoder_,
                .send_message =
                    [&](const address_t& sender,
                        const chain_selector_t destination,
                        const address_t& receiver, bytes_t data) {
                      auto send = send_message_t{};
                      send.destination_chain_selector = destination;
                      send.receiver = receiver;
                      send.data = std::move(data);
                      send.fee_token = unit.fee_token;
                      return conduit::relay::outbound{ctx, router_}.send(
                          sender, send);
                    }};
            try {
              return table_.dispatch(
                  facet,
                  bytes_view_t{request.data.data(), request.data.size()});
            } catch (const std::exception& ex) {
              spdlog::warn("Facet call threw: {}", ex.what());
              return conduit::common::make_error(
                  transaction_error_code::facet_call_failed, ex.what());
            }
          }},
      tx.payload);
}

conduit::schema::block_result_t engine::finalize_block(
    const uint64_t height,
    const std::vector<conduit::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  // A finalize without commit replaces the previous candidate block.
  pending_block_ = std::make_unique<conduit::storage::overlay>(storage_);

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        encoder_, bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(conduit::common::make_error(
          transaction_error_code::invalid_transaction, decode_error));
      continue;
    }

    auto tx_state = conduit::storage::overlay{*pending_block_};
    auto tx_result = validate_transaction(*maybe_tx, tx_state,
                                          conduit::common::kExecuteCodespace);
    if (tx_result.code == 0) {
      auto unit = load_unit(tx_state);
      if (!unit) {
        tx_result = conduit::common::make_error(
            transaction_error_code::not_initialized,
            "unit has not been provisioned");
      } else {
        tx_result = execute_operation(*maybe_tx, *unit, tx_state, height);
      }
    }

    if (tx_result.code == 0) {
      tx_state.put(encoder_, key::make_nonce_key(encoder_, maybe_tx->signer),
                   maybe_tx->nonce);
      tx_state.merge_into_parent();
      rolling_root = fold_state_root(encoder_, rolling_root, txs[i], height, i);
    } else {
      tx_state.discard();
      spdlog::debug("Transaction {} at height {} failed: {} ({})", i, height,
                    tx_result.log, tx_result.info);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

conduit::schema::commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto writes = std::vector<conduit::storage::write_entry_t>{};
  if (pending_block_) {
    writes = pending_block_->writes();
  }
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  storage_.commit(writes, conduit::storage::committed_state{
                              .height = last_committed_height_,
                              .state_root = last_committed_state_root_});
  pending_block_.reset();
  spdlog::debug("Committed height {} with {} write(s)", last_committed_height_,
                writes.size());

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

conduit::schema::app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

conduit::schema::query_result_t engine::query(
    const std::string_view path,
    const conduit::schema::bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto state = conduit::storage::overlay{storage_};
  auto unit = load_unit(state).value_or(unit_info_t{});
  auto ctx = conduit::relay::context{.encoder = encoder_,
                                     .state = state,
                                     .unit = unit,
                                     .height = static_cast<uint64_t>(
                                         last_committed_height_)};

  auto respond = [&](const auto& value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(value);
    result.height = last_committed_height_;
    return result;
  };
  auto invalid_key = [&](std::string info) {
    return make_query_error(query_error_code::invalid_key, std::move(info),
                            data, last_committed_height_);
  };
  auto not_found = [&](std::string info) {
    return make_query_error(query_error_code::not_found, std::move(info), data,
                            last_committed_height_);
  };

  if (path == "/engine/info") {
    return respond(
        std::tuple{last_committed_height_, last_committed_state_root_,
                   chain_id_});
  }
  if (path == "/unit/info") {
    if (is_zero(unit.self)) {
      return not_found("unit has not been provisioned");
    }
    return respond(unit);
  }
  if (path == "/allowlist/destination" || path == "/allowlist/source") {
    auto chain = encoder_.try_decode<chain_selector_t>(data);
    if (!chain) {
      return invalid_key("expected SCALE(chain_selector)");
    }
    auto allowed = conduit::relay::allowlist{ctx};
    return respond(path == "/allowlist/destination"
                       ? allowed.is_destination_allowed(*chain)
                       : allowed.is_source_allowed(*chain));
  }
  if (path == "/allowlist/sender") {
    auto key = encoder_.try_decode<std::tuple<chain_selector_t, address_t>>(data);
    if (!key) {
      return invalid_key("expected SCALE(tuple{chain_selector, address})");
    }
    return respond(conduit::relay::allowlist{ctx}.is_sender_allowed(
        std::get<0>(*key), std::get<1>(*key)));
  }
  if (path == "/relay/router") {
    auto router = conduit::relay::router_registry{ctx}.current();
    if (!router) {
      return not_found("no router registered");
    }
    return respond(*router);
  }
  if (path == "/relay/failed_message" || path == "/relay/message_status") {
    auto message_id = encoder_.try_decode<message_id_t>(data);
    if (!message_id) {
      return invalid_key("expected SCALE(message_id)");
    }
    auto ledger = conduit::relay::failure_ledger{ctx};
    if (path == "/relay/message_status") {
      return respond(ledger.status(*message_id));
    }
    auto record = ledger.find(*message_id);
    if (!record) {
      return not_found("no failure record for " + to_hex(*message_id));
    }
    return respond(*record);
  }
  if (path == "/relay/failed_messages") {
    return respond(conduit::relay::failure_ledger{ctx}.list());
  }
  if (path == "/relay/outbox") {
    return respond(conduit::relay::local_router::outbox(encoder_, state));
  }
  if (path == "/access/role") {
    auto key = encoder_.try_decode<std::tuple<role_id_t, address_t>>(data);
    if (!key) {
      return invalid_key("expected SCALE(tuple{role, address})");
    }
    return respond(conduit::access::access_control{encoder_, state}.has_role(
        std::get<0>(*key), std::get<1>(*key)));
  }
  if (path == "/assets/balance") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!key) {
      return invalid_key("expected SCALE(tuple{asset, owner})");
    }
    return respond(conduit::assets::ledger{encoder_, state}.balance_of(
        std::get<0>(*key), std::get<1>(*key)));
  }
  if (path == "/assets/allowance") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t, address_t>>(
        data);
    if (!key) {
      return invalid_key("expected SCALE(tuple{asset, owner, spender})");
    }
    return respond(conduit::assets::ledger{encoder_, state}.allowance(
        std::get<0>(*key), std::get<1>(*key), std::get<2>(*key)));
  }
  if (path == "/dispatch/functions") {
    return respond(table_.functions());
  }
  if (path == "/facet/mint/owner") {
    auto token_id = encoder_.try_decode<amount_t>(data);
    if (!token_id) {
      return invalid_key("expected SCALE(uint256)");
    }
    auto owner =
        conduit::facets::cross_chain_mint::owner_of(encoder_, state, *token_id);
    if (!owner) {
      return not_found("token " + to_string(*token_id) + " is not minted");
    }
    return respond(*owner);
  }
  if (path == "/facet/mint/name" || path == "/facet/mint/symbol") {
    if (is_zero(unit.self)) {
      return not_found("unit has not been provisioned");
    }
    return respond(path == "/facet/mint/name" ? unit.name : unit.symbol);
  }
  if (path == "/facet/mint/token_uri") {
    auto token_id = encoder_.try_decode<amount_t>(data);
    if (!token_id) {
      return invalid_key("expected SCALE(uint256)");
    }
    auto uri = conduit::facets::cross_chain_mint::token_uri(encoder_, state,
                                                            unit, *token_id);
    if (!uri) {
      return not_found("token " + to_string(*token_id) + " is not minted");
    }
    return respond(*uri);
  }

  spdlog::debug("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported path " + std::string{path}, data,
                          last_committed_height_);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

const conduit::schema::hash32_t& engine::chain_id() const {
  return chain_id_;
}

std::optional<conduit::schema::unit_info_t> engine::load_unit(
    const conduit::storage::overlay& state) const {
  return state.get<unit_info_t>(encoder_, key::make_unit_key(encoder_));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }
}

}  // namespace conduit::execution
