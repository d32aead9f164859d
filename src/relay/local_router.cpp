#include <conduit/relay/local_router.hpp>

#include <conduit/blake3/hash.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>

namespace conduit::relay {

local_router::local_router(
    conduit::schema::encoding::scale_encoder_t& encoder,
    fee_schedule schedule,
    std::set<conduit::schema::chain_selector_t> supported_chains)
    : encoder_{encoder},
      schedule_{std::move(schedule)},
      supported_chains_{std::move(supported_chains)} {}

bool local_router::is_chain_supported(
    const conduit::schema::chain_selector_t destination) const {
  return supported_chains_.contains(destination);
}

std::optional<conduit::schema::amount_t> local_router::get_fee(
    const conduit::schema::chain_selector_t destination,
    const conduit::schema::outbound_message_t& message) const {
  if (!is_chain_supported(destination)) {
    return std::nullopt;
  }
  auto size = conduit::schema::amount_t{message.data.size()};
  return schedule_.base_fee + (schedule_.per_byte_fee * size);
}

std::optional<conduit::schema::message_id_t> local_router::ccip_send(
    router_call& call,
    const conduit::schema::chain_selector_t destination,
    const conduit::schema::outbound_message_t& message) {
  auto fee = get_fee(destination, message);
  if (!fee) {
    spdlog::warn("Router refused unsupported destination {}", destination);
    return std::nullopt;
  }

  auto fee_collected =
      conduit::schema::is_zero(message.fee_token)
          ? call.ledger.transfer(conduit::schema::kNativeAsset, call.sender,
                                 call.router, *fee)
          : call.ledger.transfer_from(message.fee_token, call.router,
                                      call.sender, call.router, *fee);
  if (!fee_collected) {
    spdlog::warn("Router could not collect fee {} from {}",
                 conduit::schema::to_string(*fee),
                 conduit::schema::to_hex(call.sender));
    return std::nullopt;
  }

  for (const auto& token_amount : message.token_amounts) {
    if (token_amount.amount == 0) {
      continue;
    }
    auto token = conduit::schema::try_make_address(conduit::schema::bytes_view_t{
        token_amount.token.data(), token_amount.token.size()});
    if (!token || !call.ledger.transfer_from(*token, call.router, call.sender,
                                             call.router,
                                             token_amount.amount)) {
      spdlog::warn("Router could not lock token amount from {}",
                   conduit::schema::to_hex(call.sender));
      return std::nullopt;
    }
  }

  auto sequence_key = conduit::schema::key::make_outbox_sequence_key(encoder_);
  auto sequence =
      call.state.get<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  call.state.put(encoder_, sequence_key, sequence);

  auto material = encoder_.encode(std::tuple{sequence,
                                             call.source_chain_selector,
                                             destination, call.sender,
                                             message});
  auto message_id = conduit::blake3::hash(
      conduit::schema::bytes_view_t{material.data(), material.size()});

  auto entry = conduit::schema::outbox_entry_t{};
  entry.message_id = message_id;
  entry.sequence = sequence;
  entry.source_chain_selector = call.source_chain_selector;
  entry.destination_chain_selector = destination;
  entry.sender = call.sender;
  entry.message = message;
  entry.fee_token = message.fee_token;
  entry.fee = *fee;
  entry.submitted_at_height = call.height;
  call.state.put(encoder_,
                 conduit::schema::key::make_outbox_key(encoder_, sequence),
                 entry);

  spdlog::debug("Router queued message {} as outbox #{}",
                conduit::schema::to_hex(message_id), sequence);
  return message_id;
}

std::vector<conduit::schema::outbox_entry_t> local_router::outbox(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::storage::overlay& state) {
  auto prefix = conduit::schema::key::make_prefix_key(
      encoder, conduit::schema::key::kOutboxKeyPrefix);
  auto entries = std::vector<conduit::schema::outbox_entry_t>{};
  for (const auto& [key, value] : state.list_by_prefix(prefix)) {
    entries.push_back(encoder.decode<conduit::schema::outbox_entry_t>(
        conduit::schema::bytes_view_t{value.data(), value.size()}));
  }
  std::ranges::sort(entries, {}, &conduit::schema::outbox_entry_t::sequence);
  return entries;
}

}  // namespace conduit::relay
