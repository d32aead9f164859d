#pragma once

#include <conduit/relay/context.hpp>
#include <conduit/relay/router.hpp>
#include <conduit/schema/send_message.hpp>
#include <conduit/schema/transaction_result.hpp>

namespace conduit::relay {

/// Allowlist-gated, fee-metered submission of one message through the
/// registered router. Any account may send; the unit pays the fee and
/// provides the token amount from its own balances.
///
/// Every failure is returned before or instead of a state change the caller
/// keeps: the surrounding transaction overlay is discarded on a non-zero code.
/// On success the result data holds the 32-byte message id.
class outbound final {
 public:
  outbound(context& ctx, router& relay_router);

  conduit::schema::transaction_result_t send(
      const conduit::schema::address_t& caller,
      const conduit::schema::send_message_t& request);

 private:
  context& ctx_;
  router& router_;
};

}  // namespace conduit::relay
