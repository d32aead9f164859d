#pragma once

#include <conduit/assets/ledger.hpp>
#include <conduit/schema/outbound_message.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/storage/overlay.hpp>
#include <optional>

namespace conduit::relay {

/// One submission as seen by the router: the unit's state, its asset ledger,
/// the submitting unit and the router's own registered address.
struct router_call final {
  conduit::storage::overlay& state;
  conduit::assets::ledger& ledger;
  conduit::schema::address_t sender;
  conduit::schema::address_t router;
  conduit::schema::chain_selector_t source_chain_selector{};
  uint64_t height{};
};

/// Outbound relay service. Quotes are synchronous and trusted.
///
/// ccip_send collects the fee (native from the sender's balance, or an ERC
/// fee token through the allowance the sender granted to `router`) and the
/// token amounts, and returns the relay-assigned message id. std::nullopt
/// means the submission was refused; the caller discards the transaction.
class router {
 public:
  virtual ~router() = default;

  virtual bool is_chain_supported(
      conduit::schema::chain_selector_t destination) const = 0;

  virtual std::optional<conduit::schema::amount_t> get_fee(
      conduit::schema::chain_selector_t destination,
      const conduit::schema::outbound_message_t& message) const = 0;

  virtual std::optional<conduit::schema::message_id_t> ccip_send(
      router_call& call,
      conduit::schema::chain_selector_t destination,
      const conduit::schema::outbound_message_t& message) = 0;
};

}  // namespace conduit::relay
