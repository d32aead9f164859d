#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/relay/context.hpp>
#include <conduit/schema/transaction_result.hpp>

namespace conduit::relay {

/// Receive callback: the only entry point the router may invoke.
///
/// Router identity, decoding, source chain and sender are checked strictly
/// in that order, and all of them before the payload is dispatched. Once the
/// checks pass the delivery itself succeeds: an application failure becomes a
/// failure ledger record, not a failed transaction.
class inbound final {
 public:
  inbound(context& ctx, const conduit::dispatch::dispatch_table& table);

  conduit::schema::transaction_result_t receive(
      const conduit::schema::address_t& caller,
      const conduit::schema::bytes_view_t& raw);

 private:
  context& ctx_;
  const conduit::dispatch::dispatch_table& table_;
};

}  // namespace conduit::relay
