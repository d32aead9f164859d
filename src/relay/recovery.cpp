#include <conduit/relay/recovery.hpp>

#include <conduit/access/access_control.hpp>
#include <conduit/common/result.hpp>
#include <conduit/relay/failure_ledger.hpp>
#include <conduit/relay/self_dispatch.hpp>
#include <spdlog/spdlog.h>

namespace conduit::relay {

recovery::recovery(context& ctx, const conduit::dispatch::dispatch_table& table)
    : ctx_{ctx}, table_{table} {}

conduit::schema::transaction_result_t recovery::retry_failed_message(
    const conduit::schema::address_t& caller,
    const conduit::schema::retry_failed_message_t& request) {
  using conduit::schema::transaction_error_code;

  auto roles = conduit::access::access_control{ctx_.encoder, ctx_.state};
  if (auto denied =
          roles.require_role(conduit::schema::role_id_t::admin, caller)) {
    return *denied;
  }

  const auto id = conduit::schema::to_hex(request.message_id);
  auto ledger = failure_ledger{ctx_};
  auto record = ledger.find(request.message_id);
  if (!record) {
    return conduit::common::make_error(
        transaction_error_code::message_not_failed,
        "no failure recorded for " + id);
  }

  auto origin = message_origin{.message_id = record->message_id,
                               .source_chain_selector =
                                   record->source_chain_selector,
                               .sender = record->sender};
  auto outcome = apply_payload(
      ctx_, table_, origin,
      conduit::schema::bytes_view_t{request.data.data(), request.data.size()});

  if (auto* failure = std::get_if<conduit::schema::failure_record_t>(&outcome)) {
    auto reason = conduit::schema::make_string(failure->reason);
    spdlog::warn("Retry of {} failed again: {}", id, reason);
    return conduit::common::make_error(
        transaction_error_code::message_application_failed, reason);
  }

  ledger.clear(request.message_id);
  spdlog::info("Message {} recovered by {}", id,
               conduit::schema::to_hex(caller));

  auto result = conduit::schema::transaction_result_t{};
  result.events = std::move(std::get<applied_t>(outcome).events);
  result.events.push_back(
      conduit::common::make_event("message_recovered", {{"message_id", id}}));
  return result;
}

}  // namespace conduit::relay
