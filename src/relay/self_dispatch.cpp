#include <conduit/relay/self_dispatch.hpp>

#include <conduit/schema/transaction_error_code.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace conduit::relay {

namespace {

conduit::schema::failure_record_t make_failure(const context& ctx,
                                               const message_origin& origin,
                                               const uint32_t code,
                                               const std::string& reason) {
  auto record = conduit::schema::failure_record_t{};
  record.message_id = origin.message_id;
  record.error_state = conduit::schema::error_state_t::basic;
  record.code = code;
  record.reason = conduit::schema::make_bytes(
      reason.empty() ? std::string{"application failed"} : reason);
  record.source_chain_selector = origin.source_chain_selector;
  record.sender = origin.sender;
  record.failed_at_height = ctx.height;
  return record;
}

}  // namespace

application_outcome_t apply_payload(
    context& ctx,
    const conduit::dispatch::dispatch_table& table,
    const message_origin& origin,
    const conduit::schema::bytes_view_t& call_data) {
  auto scratch = conduit::storage::overlay{ctx.state};
  auto facet = conduit::dispatch::facet_context{.caller = ctx.unit.self,
                                                .self = ctx.unit.self,
                                                .height = ctx.height,
                                                .state = scratch,
                                                .encoder = ctx.encoder};

  auto result = conduit::schema::transaction_result_t{};
  try {
    result = table.dispatch(facet, call_data);
  } catch (const std::exception& ex) {
    scratch.discard();
    spdlog::warn("Payload for {} threw: {}",
                 conduit::schema::to_hex(origin.message_id), ex.what());
    return make_failure(
        ctx, origin,
        static_cast<uint32_t>(
            conduit::schema::transaction_error_code::facet_call_failed),
        ex.what());
  }

  if (result.code != 0) {
    scratch.discard();
    auto reason = result.log;
    if (!result.info.empty()) {
      reason += ": " + result.info;
    }
    return make_failure(ctx, origin, result.code, reason);
  }

  scratch.merge_into_parent();
  return applied_t{.events = std::move(result.events)};
}

}  // namespace conduit::relay
