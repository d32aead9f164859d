#pragma once
#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace conduit::blake3 {

conduit::schema::hash32_t hash(const std::string_view& str);
conduit::schema::hash32_t hash(const conduit::schema::bytes_view_t& bytes);

/// Function selector: first four bytes of the signature string hash.
conduit::schema::selector_t selector(const std::string_view& signature);

}  // namespace conduit::blake3
