#pragma once

#include <conduit/relay/router.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/outbox_entry.hpp>
#include <set>
#include <vector>

namespace conduit::relay {

struct fee_schedule final {
  conduit::schema::amount_t base_fee{};
  conduit::schema::amount_t per_byte_fee{};
};

/// In-process router: fixed fee schedule, an explicit set of reachable
/// destinations, and a persistent outbox drained by external relayers.
///
/// Message ids are blake3(SCALE(sequence, source, destination, sender,
/// message)).
class local_router final : public router {
 public:
  local_router(conduit::schema::encoding::scale_encoder_t& encoder,
               fee_schedule schedule,
               std::set<conduit::schema::chain_selector_t> supported_chains);

  bool is_chain_supported(
      conduit::schema::chain_selector_t destination) const override;

  std::optional<conduit::schema::amount_t> get_fee(
      conduit::schema::chain_selector_t destination,
      const conduit::schema::outbound_message_t& message) const override;

  std::optional<conduit::schema::message_id_t> ccip_send(
      router_call& call,
      conduit::schema::chain_selector_t destination,
      const conduit::schema::outbound_message_t& message) override;

  /// Outbox entries visible through `state`, in submission order.
  static std::vector<conduit::schema::outbox_entry_t> outbox(
      conduit::schema::encoding::scale_encoder_t& encoder,
      const conduit::storage::overlay& state);

 private:
  conduit::schema::encoding::scale_encoder_t& encoder_;
  fee_schedule schedule_;
  std::set<conduit::schema::chain_selector_t> supported_chains_;
};

}  // namespace conduit::relay
