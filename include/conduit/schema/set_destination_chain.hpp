#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

namespace conduit::schema {

template <uint16_t Version>
struct set_destination_chain;

template <>
struct set_destination_chain<1> final {
  uint16_t version{1};
  chain_selector_t chain_selector{};
  bool allowed{true};
};

using set_destination_chain_t = set_destination_chain<1>;

}  // namespace conduit::schema
