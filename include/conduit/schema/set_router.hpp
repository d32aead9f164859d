#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

namespace conduit::schema {

template <uint16_t Version>
struct set_router;

template <>
struct set_router<1> final {
  uint16_t version{1};
  address_t router{};
};

using set_router_t = set_router<1>;

}  // namespace conduit::schema
