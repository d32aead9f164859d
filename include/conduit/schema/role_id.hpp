#pragma once

#include <conduit/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: role id.
// Relay workflow: Access-control roles consumed by the relay core. `admin`
// guards allowlist, router and recovery mutations.
namespace conduit::schema {

enum class role_id_t : uint8_t { admin = 0, minter = 1 };

inline constexpr auto kRoleIdNames = make_enum_names<role_id_t>(
    std::pair{role_id_t::admin, "admin"},
    std::pair{role_id_t::minter, "minter"});

inline constexpr std::string_view to_string(const role_id_t value) {
  return kRoleIdNames.name_of(value);
}

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return kRoleIdNames.value_of(value);
}

}  // namespace conduit::schema
