#pragma once

#include <conduit/relay/context.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <optional>

namespace conduit::relay {

/// The single router identity allowed to deliver inbound messages and to
/// collect outbound fees.
class router_registry final {
 public:
  explicit router_registry(context& ctx);

  std::optional<conduit::schema::address_t> current() const;

  /// Admin-gated replacement of the registered router.
  conduit::schema::transaction_result_t set(
      const conduit::schema::address_t& caller,
      const conduit::schema::address_t& router);

  /// Provisioning-time registration; bypasses the admin guard.
  void initialize(const conduit::schema::address_t& router);

 private:
  context& ctx_;
};

}  // namespace conduit::relay
