#pragma once

#include <conduit/schema/outbound_message.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: outbox entry.
// Relay workflow: Submission accepted by the local router, waiting for an
// external relayer to carry it to the destination chain.
namespace conduit::schema {

template <uint16_t Version>
struct outbox_entry;

template <>
struct outbox_entry<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  uint64_t sequence{};
  chain_selector_t source_chain_selector{};
  chain_selector_t destination_chain_selector{};
  address_t sender{};
  outbound_message_t message;
  address_t fee_token{};
  amount_t fee{};
  uint64_t submitted_at_height{};
};

using outbox_entry_t = outbox_entry<1>;

}  // namespace conduit::schema
