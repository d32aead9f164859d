#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: set sender.
// Relay workflow: Sender allowlist entries are scoped to the source chain they
// are accepted from.
namespace conduit::schema {

template <uint16_t Version>
struct set_sender;

template <>
struct set_sender<1> final {
  uint16_t version{1};
  chain_selector_t chain_selector{};
  address_t sender{};
  bool allowed{true};
};

using set_sender_t = set_sender<1>;

}  // namespace conduit::schema
