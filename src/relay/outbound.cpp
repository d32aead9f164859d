#include <conduit/relay/outbound.hpp>

#include <conduit/assets/ledger.hpp>
#include <conduit/common/result.hpp>
#include <conduit/relay/allowlist.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/relay/router_registry.hpp>
#include <spdlog/spdlog.h>

namespace conduit::relay {

outbound::outbound(context& ctx, router& relay_router)
    : ctx_{ctx}, router_{relay_router} {}

conduit::schema::transaction_result_t outbound::send(
    const conduit::schema::address_t& caller,
    const conduit::schema::send_message_t& request) {
  using conduit::schema::transaction_error_code;
  const auto destination = request.destination_chain_selector;

  auto registered = router_registry{ctx_}.current();
  if (!registered) {
    return conduit::common::make_error(transaction_error_code::invalid_router,
                                       "no router registered");
  }

  if (!allowlist{ctx_}.is_destination_allowed(destination)) {
    spdlog::warn("Send to {} rejected: destination not allowlisted",
                 destination);
    return conduit::common::make_error(
        transaction_error_code::destination_chain_not_allowlisted,
        "destination chain " + std::to_string(destination));
  }

  if (!router_.is_chain_supported(destination)) {
    return conduit::common::make_error(
        transaction_error_code::destination_chain_not_supported,
        "router does not reach chain " + std::to_string(destination));
  }

  auto message =
      codec::encode(request.receiver, request.data, request.token,
                    request.amount, request.fee_token, ctx_.unit.gas_limit);

  auto fee = router_.get_fee(destination, message);
  if (!fee) {
    return conduit::common::make_error(transaction_error_code::fee_quote_failed,
                                       "router returned no quote");
  }

  const auto& self = ctx_.unit.self;
  auto ledger = conduit::assets::ledger{ctx_.encoder, ctx_.state};
  auto fee_balance = ledger.balance_of(request.fee_token, self);
  if (fee_balance < *fee) {
    spdlog::warn("Send to {} rejected: fee {} exceeds balance {}", destination,
                 conduit::schema::to_string(*fee),
                 conduit::schema::to_string(fee_balance));
    return conduit::common::make_error(
        transaction_error_code::insufficient_balance,
        "fee " + conduit::schema::to_string(*fee) + " exceeds balance " +
            conduit::schema::to_string(fee_balance));
  }

  // amount + fee is never formed before it is known to fit in the balance.
  const auto same_asset = request.token == request.fee_token;
  if (request.amount > 0) {
    auto token_balance = ledger.balance_of(request.token, self);
    if (token_balance < request.amount ||
        (same_asset && token_balance - request.amount < *fee)) {
      spdlog::warn("Send to {} rejected: token amount {} exceeds balance {}",
                   destination, conduit::schema::to_string(request.amount),
                   conduit::schema::to_string(token_balance));
      return conduit::common::make_error(
          transaction_error_code::insufficient_balance,
          "token amount " + conduit::schema::to_string(request.amount) +
              " exceeds balance " + conduit::schema::to_string(token_balance));
    }
  }

  if (!conduit::schema::is_zero(request.fee_token)) {
    ledger.approve(request.fee_token, self, *registered, *fee);
  }
  if (request.amount > 0) {
    auto allowance = request.amount;
    if (same_asset && !conduit::schema::is_zero(request.fee_token)) {
      allowance += *fee;
    }
    ledger.approve(request.token, self, *registered, allowance);
  }

  auto call = router_call{.state = ctx_.state,
                          .ledger = ledger,
                          .sender = self,
                          .router = *registered,
                          .source_chain_selector =
                              ctx_.unit.local_chain_selector,
                          .height = ctx_.height};
  auto message_id = router_.ccip_send(call, destination, message);
  if (!message_id || conduit::schema::is_zero(*message_id)) {
    return conduit::common::make_error(
        transaction_error_code::relay_submission_failed,
        "router refused the message");
  }

  spdlog::info("Message {} sent to chain {} by {}",
               conduit::schema::to_hex(*message_id), destination,
               conduit::schema::to_hex(caller));

  auto result = conduit::schema::transaction_result_t{};
  result.data = conduit::schema::bytes_t{std::begin(*message_id),
                                         std::end(*message_id)};
  result.events.push_back(conduit::common::make_event(
      "message_sent",
      {{"message_id", conduit::schema::to_hex(*message_id)},
       {"destination_chain_selector", std::to_string(destination)},
       {"receiver", conduit::schema::to_hex(request.receiver)},
       {"token", conduit::schema::to_hex(request.token)},
       {"amount", conduit::schema::to_string(request.amount)},
       {"fee_token", conduit::schema::to_hex(request.fee_token)},
       {"fee", conduit::schema::to_string(*fee)},
       {"sender", conduit::schema::to_hex(caller)}}));
  return result;
}

}  // namespace conduit::relay
