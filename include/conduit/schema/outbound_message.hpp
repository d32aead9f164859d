#pragma once

#include <conduit/schema/primitives.hpp>
#include <conduit/schema/token_amount.hpp>
#include <cstdint>
#include <vector>

// Schema type: outbound message.
// Relay workflow: Message handed to the router on send. Built fresh per call;
// the unit keeps no copy once the router has returned a message id.
namespace conduit::schema {

template <uint16_t Version>
struct outbound_message;

template <>
struct outbound_message<1> final {
  uint16_t version{1};
  bytes_t receiver;
  bytes_t data;
  std::vector<token_amount_t> token_amounts;
  address_t fee_token{};
  bytes_t extra_args;
};

using outbound_message_t = outbound_message<1>;

}  // namespace conduit::schema
