#pragma once

#include <conduit/schema/primitives.hpp>
#include <conduit/schema/token_amount.hpp>
#include <cstdint>
#include <vector>

// Schema type: inbound message.
// Relay workflow: Message delivered by the router to the receive callback.
// `message_id` is relay-assigned and keys every failure-ledger operation.
namespace conduit::schema {

template <uint16_t Version>
struct inbound_message;

template <>
struct inbound_message<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  chain_selector_t source_chain_selector{};
  bytes_t sender;
  bytes_t data;
  std::vector<token_amount_t> token_amounts;
};

using inbound_message_t = inbound_message<1>;

}  // namespace conduit::schema
