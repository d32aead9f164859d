#pragma once

#include <conduit/schema/transaction_error_code.hpp>
#include <conduit/schema/transaction_event.hpp>
#include <conduit/schema/transaction_result.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace conduit::common {

inline constexpr auto kExecuteCodespace = std::string_view{"conduit.execute"};
inline constexpr auto kCheckCodespace = std::string_view{"conduit.checktx"};
inline constexpr auto kQueryCodespace = std::string_view{"conduit.query"};

inline conduit::schema::transaction_result_t make_error(
    const conduit::schema::transaction_error_code code,
    std::string info,
    const std::string_view codespace = kExecuteCodespace) {
  auto result = conduit::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{conduit::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

inline conduit::schema::transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string, std::string>> attributes) {
  auto event = conduit::schema::transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    event.attributes.push_back(conduit::schema::transaction_event_attribute_t{
        .key = key, .value = value, .index = true});
  }
  return event;
}

}  // namespace conduit::common
