#include <conduit/facets/cross_chain_mint.hpp>

#include <conduit/blake3/hash.hpp>
#include <conduit/common/result.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace conduit::facets::cross_chain_mint {

namespace {

using conduit::schema::transaction_error_code;

conduit::schema::transaction_result_t mint(
    conduit::dispatch::facet_context& ctx,
    const conduit::schema::bytes_view_t& arguments) {
  auto args = ctx.encoder.try_decode<
      std::tuple<conduit::schema::address_t, conduit::schema::amount_t>>(
      arguments);
  if (!args) {
    return conduit::common::make_error(transaction_error_code::invalid_argument,
                                       "mint expects (address, uint256)");
  }
  const auto& [to, token_id] = *args;
  if (conduit::schema::is_zero(to)) {
    return conduit::common::make_error(transaction_error_code::invalid_argument,
                                       "mint to the zero address");
  }
  auto key = conduit::schema::key::make_mint_owner_key(ctx.encoder, token_id);
  if (ctx.state.contains(key)) {
    return conduit::common::make_error(
        transaction_error_code::facet_call_failed,
        "token " + conduit::schema::to_string(token_id) + " already minted");
  }
  ctx.state.put(ctx.encoder, key, to);
  spdlog::info("Minted token {} to {}", conduit::schema::to_string(token_id),
               conduit::schema::to_hex(to));

  auto result = conduit::schema::transaction_result_t{};
  result.events.push_back(conduit::common::make_event(
      "token_minted", {{"token_id", conduit::schema::to_string(token_id)},
                       {"owner", conduit::schema::to_hex(to)}}));
  return result;
}

conduit::schema::transaction_result_t burn_owned(
    conduit::dispatch::facet_context& ctx,
    const conduit::schema::amount_t& token_id) {
  auto owner = owner_of(ctx.encoder, ctx.state, token_id);
  if (!owner) {
    return conduit::common::make_error(
        transaction_error_code::facet_call_failed,
        "token " + conduit::schema::to_string(token_id) + " does not exist");
  }
  if (*owner != ctx.caller) {
    return conduit::common::make_error(transaction_error_code::unauthorized,
                                       "caller does not own the token");
  }
  ctx.state.erase(
      conduit::schema::key::make_mint_owner_key(ctx.encoder, token_id));

  auto result = conduit::schema::transaction_result_t{};
  result.events.push_back(conduit::common::make_event(
      "token_burned", {{"token_id", conduit::schema::to_string(token_id)},
                       {"owner", conduit::schema::to_hex(*owner)}}));
  return result;
}

conduit::schema::transaction_result_t burn(
    conduit::dispatch::facet_context& ctx,
    const conduit::schema::bytes_view_t& arguments) {
  auto token_id = ctx.encoder.try_decode<conduit::schema::amount_t>(arguments);
  if (!token_id) {
    return conduit::common::make_error(transaction_error_code::invalid_argument,
                                       "burn expects (uint256)");
  }
  return burn_owned(ctx, *token_id);
}

// The burn and the send share the caller's transaction, so a rejected send
// leaves the token with its owner.
conduit::schema::transaction_result_t burn_and_mint(
    conduit::dispatch::facet_context& ctx,
    const conduit::schema::bytes_view_t& arguments) {
  if (!ctx.send_message) {
    return conduit::common::make_error(
        transaction_error_code::facet_call_failed,
        "burn_and_mint cannot be applied from a delivered message");
  }
  auto args = ctx.encoder.try_decode<
      std::tuple<conduit::schema::chain_selector_t, conduit::schema::address_t,
                 conduit::schema::address_t, conduit::schema::amount_t>>(
      arguments);
  if (!args) {
    return conduit::common::make_error(
        transaction_error_code::invalid_argument,
        "burn_and_mint expects (uint64, address, address, uint256)");
  }
  const auto& [destination, receiver, to, token_id] = *args;
  if (conduit::schema::is_zero(to)) {
    return conduit::common::make_error(transaction_error_code::invalid_argument,
                                       "mint to the zero address");
  }

  auto result = burn_owned(ctx, token_id);
  if (result.code != 0) {
    return result;
  }
  auto sent = ctx.send_message(ctx.caller, destination, receiver,
                               make_mint_call(to, token_id));
  if (sent.code != 0) {
    spdlog::warn("Token {} kept: send to chain {} failed",
                 conduit::schema::to_string(token_id), destination);
    return sent;
  }

  const auto message_id = conduit::schema::to_hex(
      conduit::schema::bytes_view_t{sent.data.data(), sent.data.size()});
  spdlog::info("Token {} burned for chain {} in message {}",
               conduit::schema::to_string(token_id), destination, message_id);
  result.data = std::move(sent.data);
  std::move(std::begin(sent.events), std::end(sent.events),
            std::back_inserter(result.events));
  result.events.push_back(conduit::common::make_event(
      "token_bridged",
      {{"token_id", conduit::schema::to_string(token_id)},
       {"destination_chain_selector", std::to_string(destination)},
       {"receiver", conduit::schema::to_hex(receiver)},
       {"to", conduit::schema::to_hex(to)},
       {"message_id", message_id}}));
  return result;
}

}  // namespace

void register_functions(conduit::dispatch::dispatch_table& table) {
  table.add(std::string{kFacetName}, std::string{kMintSignature},
            conduit::dispatch::visibility_t::self_only, mint);
  table.add(std::string{kFacetName}, std::string{kBurnSignature},
            conduit::dispatch::visibility_t::external, burn);
  table.add(std::string{kFacetName}, std::string{kBurnAndMintSignature},
            conduit::dispatch::visibility_t::external, burn_and_mint);
}

std::optional<conduit::schema::address_t> owner_of(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::storage::overlay& state,
    const conduit::schema::amount_t& token_id) {
  return state.get<conduit::schema::address_t>(
      encoder, conduit::schema::key::make_mint_owner_key(encoder, token_id));
}

std::optional<std::string> token_uri(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::storage::overlay& state,
    const conduit::schema::unit_info_t& unit,
    const conduit::schema::amount_t& token_id) {
  if (!owner_of(encoder, state, token_id)) {
    return std::nullopt;
  }
  return unit.base_uri + conduit::schema::to_string(token_id);
}

conduit::schema::bytes_t make_mint_call(
    const conduit::schema::address_t& to,
    const conduit::schema::amount_t& token_id) {
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  return conduit::relay::codec::make_call_data(
      conduit::blake3::selector(kMintSignature),
      encoder.encode(std::tuple{to, token_id}));
}

conduit::schema::bytes_t make_burn_call(
    const conduit::schema::amount_t& token_id) {
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  return conduit::relay::codec::make_call_data(
      conduit::blake3::selector(kBurnSignature), encoder.encode(token_id));
}

conduit::schema::bytes_t make_burn_and_mint_call(
    const conduit::schema::chain_selector_t destination,
    const conduit::schema::address_t& receiver,
    const conduit::schema::address_t& to,
    const conduit::schema::amount_t& token_id) {
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  return conduit::relay::codec::make_call_data(
      conduit::blake3::selector(kBurnAndMintSignature),
      encoder.encode(std::tuple{destination, receiver, to, token_id}));
}

}  // namespace conduit::facets::cross_chain_mint
