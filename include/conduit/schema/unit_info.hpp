#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: unit info.
// Provisioning workflow: Metadata fixed by the one-time initializer. The
// router address here is the initial registration; set_router replaces it.
namespace conduit::schema {

template <uint16_t Version>
struct unit_info;

template <>
struct unit_info<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  std::string base_uri;
  address_t fee_token{};
  address_t self{};
  chain_selector_t local_chain_selector{};
  uint64_t gas_limit{};
};

using unit_info_t = unit_info<1>;

}  // namespace conduit::schema
