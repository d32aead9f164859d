#pragma once

#include <conduit/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: query error code.
// Relay workflow: Read-path failure taxonomy returned by engine queries.
namespace conduit::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

inline constexpr auto kQueryErrorCodeNames = make_enum_names<query_error_code>(
    std::pair{query_error_code::invalid_key, "invalid_key"},
    std::pair{query_error_code::not_found, "not_found"},
    std::pair{query_error_code::unsupported_path, "unsupported_path"});

inline constexpr std::string_view to_string(const query_error_code value) {
  return kQueryErrorCodeNames.name_of(value);
}

}  // namespace conduit::schema
