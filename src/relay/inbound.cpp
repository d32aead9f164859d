#include <conduit/relay/inbound.hpp>

#include <conduit/common/result.hpp>
#include <conduit/relay/allowlist.hpp>
#include <conduit/relay/codec.hpp>
#include <conduit/relay/failure_ledger.hpp>
#include <conduit/relay/router_registry.hpp>
#include <conduit/relay/self_dispatch.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <string>

namespace conduit::relay {

inbound::inbound(context& ctx, const conduit::dispatch::dispatch_table& table)
    : ctx_{ctx}, table_{table} {}

conduit::schema::transaction_result_t inbound::receive(
    const conduit::schema::address_t& caller,
    const conduit::schema::bytes_view_t& raw) {
  using conduit::schema::transaction_error_code;

  auto registered = router_registry{ctx_}.current();
  if (!registered || *registered != caller) {
    spdlog::warn("Receive rejected: caller {} is not the router",
                 conduit::schema::to_hex(caller));
    return conduit::common::make_error(transaction_error_code::invalid_router,
                                       "caller is not the registered router");
  }

  auto error = std::string{};
  auto message = codec::decode(raw, error);
  if (!message) {
    spdlog::warn("Receive rejected: {}", error);
    return conduit::common::make_error(
        transaction_error_code::malformed_payload, error);
  }

  auto sender = *conduit::schema::try_make_address(conduit::schema::bytes_view_t{
      message->sender.data(), message->sender.size()});
  auto allowed = allowlist{ctx_};
  if (!allowed.is_source_allowed(message->source_chain_selector)) {
    spdlog::warn("Receive rejected: source chain {} not allowed",
                 message->source_chain_selector);
    return conduit::common::make_error(
        transaction_error_code::source_chain_not_allowed,
        "source chain " + std::to_string(message->source_chain_selector));
  }
  if (!allowed.is_sender_allowed(message->source_chain_selector, sender)) {
    spdlog::warn("Receive rejected: sender {} not allowed from {}",
                 conduit::schema::to_hex(sender),
                 message->source_chain_selector);
    return conduit::common::make_error(
        transaction_error_code::sender_not_allowed,
        "sender " + conduit::schema::to_hex(sender));
  }

  auto ledger = failure_ledger{ctx_};
  if (ledger.contains(message->message_id)) {
    return conduit::common::make_error(
        transaction_error_code::message_already_failed,
        "message " + conduit::schema::to_hex(message->message_id) +
            " is pending recovery");
  }

  const auto id = conduit::schema::to_hex(message->message_id);
  auto result = conduit::schema::transaction_result_t{};
  result.data = conduit::schema::bytes_t{std::begin(message->message_id),
                                         std::end(message->message_id)};
  auto received = conduit::common::make_event(
      "message_received",
      {{"message_id", id},
       {"source_chain_selector",
        std::to_string(message->source_chain_selector)},
       {"sender", conduit::schema::to_hex(sender)},
       {"selector", conduit::schema::to_hex(conduit::schema::bytes_view_t{
                        message->data.data(), 4})}});
  for (const auto& token_amount : message->token_amounts) {
    received.attributes.push_back(conduit::schema::transaction_event_attribute_t{
        .key = "token",
        .value = conduit::schema::to_hex(conduit::schema::bytes_view_t{
            token_amount.token.data(), token_amount.token.size()}),
        .index = true});
    received.attributes.push_back(conduit::schema::transaction_event_attribute_t{
        .key = "amount",
        .value = conduit::schema::to_string(token_amount.amount),
        .index = true});
  }
  result.events.push_back(std::move(received));

  auto origin = message_origin{.message_id = message->message_id,
                               .source_chain_selector =
                                   message->source_chain_selector,
                               .sender = message->sender};
  auto outcome = apply_payload(
      ctx_, table_, origin,
      conduit::schema::bytes_view_t{message->data.data(),
                                    message->data.size()});

  std::visit(
      overloaded{
          [&](applied_t& applied) {
            spdlog::info("Message {} applied", id);
            std::move(std::begin(applied.events), std::end(applied.events),
                      std::back_inserter(result.events));
          },
          [&](conduit::schema::failure_record_t& failure) {
            auto reason = conduit::schema::make_string(failure.reason);
            spdlog::info("Message {} failed: {}", id, reason);
            ledger.record(failure);
            result.info = "application failed";
            result.events.push_back(conduit::common::make_event(
                "message_failed", {{"message_id", id}, {"reason", reason}}));
          }},
      outcome);
  return result;
}

}  // namespace conduit::relay
