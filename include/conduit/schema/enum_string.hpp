#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace conduit::schema {

/// Fixed name table for a schema enum. Names are the stable wire and CLI
/// spelling; values without an entry print as "unknown".
template <typename Enum, std::size_t N>
struct enum_names final {
  std::array<std::pair<Enum, std::string_view>, N> entries;

  constexpr std::string_view name_of(const Enum value) const {
    for (const auto& [candidate, name] : entries) {
      if (candidate == value) {
        return name;
      }
    }
    return "unknown";
  }

  constexpr std::optional<Enum> value_of(const std::string_view name) const {
    for (const auto& [candidate, candidate_name] : entries) {
      if (candidate_name == name) {
        return candidate;
      }
    }
    return std::nullopt;
  }
};

template <typename Enum, typename... Entries>
constexpr auto make_enum_names(const Entries&... entries) {
  return enum_names<Enum, sizeof...(Entries)>{
      {std::pair<Enum, std::string_view>{entries.first, entries.second}...}};
}

/// Parses a name into `Enum`; specialized beside each enum that has a table.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace conduit::schema
