#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

namespace conduit::schema {

template <uint16_t Version>
struct genesis_allocation;

template <>
struct genesis_allocation<1> final {
  address_t asset{};
  address_t owner{};
  amount_t amount{};
};

using genesis_allocation_t = genesis_allocation<1>;

}  // namespace conduit::schema
