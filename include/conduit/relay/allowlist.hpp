#pragma once

#include <conduit/relay/context.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <string>
#include <string_view>

namespace conduit::relay {

/// Destination, source and per-source sender permission sets.
///
/// A present key means allowed. Setting an entry to false deletes it, so an
/// unset entry and a revoked entry are the same state.
class allowlist final {
 public:
  explicit allowlist(context& ctx);

  bool is_destination_allowed(conduit::schema::chain_selector_t chain) const;
  bool is_source_allowed(conduit::schema::chain_selector_t chain) const;
  bool is_sender_allowed(conduit::schema::chain_selector_t chain,
                         const conduit::schema::address_t& sender) const;

  conduit::schema::transaction_result_t set_destination_allowed(
      const conduit::schema::address_t& caller,
      conduit::schema::chain_selector_t chain,
      bool allowed);
  conduit::schema::transaction_result_t set_source_allowed(
      const conduit::schema::address_t& caller,
      conduit::schema::chain_selector_t chain,
      bool allowed);
  conduit::schema::transaction_result_t set_sender_allowed(
      const conduit::schema::address_t& caller,
      conduit::schema::chain_selector_t chain,
      const conduit::schema::address_t& sender,
      bool allowed);

 private:
  conduit::schema::transaction_result_t set_entry(
      const conduit::schema::address_t& caller,
      const conduit::schema::bytes_t& key,
      bool allowed,
      std::string_view list,
      std::string description);

  context& ctx_;
};

}  // namespace conduit::relay
