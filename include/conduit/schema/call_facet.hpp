#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: call facet.
// Dispatch workflow: Direct external call through the dispatch table. Call
// data is selector || SCALE-encoded arguments.
namespace conduit::schema {

template <uint16_t Version>
struct call_facet;

template <>
struct call_facet<1> final {
  uint16_t version{1};
  bytes_t data;
};

using call_facet_t = call_facet<1>;

}  // namespace conduit::schema
