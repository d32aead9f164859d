#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/relay/context.hpp>
#include <conduit/schema/failure_record.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/transaction_event.hpp>
#include <variant>
#include <vector>

namespace conduit::relay {

/// The payload reached its facet and every effect was kept.
struct applied_t final {
  std::vector<conduit::schema::transaction_event_t> events;
};

using application_outcome_t =
    std::variant<applied_t, conduit::schema::failure_record_t>;

/// Provenance carried into a failure record.
struct message_origin final {
  conduit::schema::message_id_t message_id{};
  conduit::schema::chain_selector_t source_chain_selector{};
  conduit::schema::bytes_t sender;
};

/// Apply `call_data` through the unit's own dispatch table with the unit as
/// caller, inside a child overlay of `ctx.state`.
///
/// On success the child is merged. On any failure, including an exception
/// thrown by the handler, the child is dropped and the outcome carries an
/// unsaved failure record. Never throws for handler errors.
application_outcome_t apply_payload(
    context& ctx,
    const conduit::dispatch::dispatch_table& table,
    const message_origin& origin,
    const conduit::schema::bytes_view_t& call_data);

}  // namespace conduit::relay
