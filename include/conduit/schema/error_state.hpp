#pragma once

#include <conduit/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: error state.
// Relay workflow: Outcome classification of an inbound message. `resolved`
// is the zero value, so a message without a failure record reads as resolved.
namespace conduit::schema {

enum class error_state_t : uint8_t { resolved = 0, basic = 1 };

inline constexpr auto kErrorStateNames = make_enum_names<error_state_t>(
    std::pair{error_state_t::resolved, "resolved"},
    std::pair{error_state_t::basic, "basic"});

inline constexpr std::string_view to_string(const error_state_t value) {
  return kErrorStateNames.name_of(value);
}

template <>
inline std::optional<error_state_t> try_from_string<error_state_t>(
    const std::string_view value) {
  return kErrorStateNames.value_of(value);
}

}  // namespace conduit::schema
