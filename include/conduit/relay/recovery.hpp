#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/relay/context.hpp>
#include <conduit/schema/retry_failed_message.hpp>
#include <conduit/schema/transaction_result.hpp>

namespace conduit::relay {

/// Operator retry of a failed inbound message. Admin-gated. Allowlists are
/// not consulted again; the record's provenance is trusted.
class recovery final {
 public:
  recovery(context& ctx, const conduit::dispatch::dispatch_table& table);

  conduit::schema::transaction_result_t retry_failed_message(
      const conduit::schema::address_t& caller,
      const conduit::schema::retry_failed_message_t& request);

 private:
  context& ctx_;
  const conduit::dispatch::dispatch_table& table_;
};

}  // namespace conduit::relay
