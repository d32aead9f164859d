#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: send message.
// Relay workflow: Outbound request. Encoded by the message codec and handed
// to the registered router; any account may submit it.
namespace conduit::schema {

template <uint16_t Version>
struct send_message;

template <>
struct send_message<1> final {
  uint16_t version{1};
  chain_selector_t destination_chain_selector{};
  address_t receiver{};
  bytes_t data;
  address_t token{};
  amount_t amount{};
  address_t fee_token{};
};

using send_message_t = send_message<1>;

}  // namespace conduit::schema
