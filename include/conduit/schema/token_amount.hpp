#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: token amount.
// Relay workflow: (token, amount) tuple carried alongside a message payload.
// An amount of zero marks a payload-only message.
namespace conduit::schema {

template <uint16_t Version>
struct token_amount;

template <>
struct token_amount<1> final {
  bytes_t token;
  amount_t amount{};
};

using token_amount_t = token_amount<1>;

}  // namespace conduit::schema
