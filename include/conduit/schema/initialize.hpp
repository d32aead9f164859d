#pragma once

#include <conduit/schema/genesis_allocation.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: initialize.
// Provisioning workflow: One-time initializer arguments. Applied directly by
// the engine, never through a transaction.
namespace conduit::schema {

template <uint16_t Version>
struct initialize;

template <>
struct initialize<1> final {
  uint16_t version{1};
  std::string name;
  std::string symbol;
  std::string base_uri;
  address_t router{};
  address_t fee_token{};
  address_t self{};
  chain_selector_t local_chain_selector{};
  uint64_t gas_limit{};
  std::vector<address_t> admins;
  std::vector<genesis_allocation_t> allocations;
};

using initialize_t = initialize<1>;

}  // namespace conduit::schema
