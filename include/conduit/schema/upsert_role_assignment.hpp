#pragma once

#include <conduit/schema/primitives.hpp>
#include <conduit/schema/role_id.hpp>
#include <cstdint>

namespace conduit::schema {

template <uint16_t Version>
struct upsert_role_assignment;

template <>
struct upsert_role_assignment<1> final {
  uint16_t version{1};
  role_id_t role{role_id_t::admin};
  address_t account{};
  bool enabled{true};
};

using upsert_role_assignment_t = upsert_role_assignment<1>;

}  // namespace conduit::schema
