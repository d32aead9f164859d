#include <conduit/access/access_control.hpp>

#include <conduit/common/result.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

namespace conduit::access {

access_control::access_control(
    conduit::schema::encoding::scale_encoder_t& encoder,
    conduit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

bool access_control::has_role(const conduit::schema::role_id_t role,
                              const conduit::schema::address_t& account) const {
  auto key = conduit::schema::key::make_role_key(encoder_, role, account);
  return state_.contains(key);
}

std::optional<conduit::schema::transaction_result_t>
access_control::require_role(const conduit::schema::role_id_t role,
                             const conduit::schema::address_t& caller) const {
  if (has_role(role, caller)) {
    return std::nullopt;
  }
  spdlog::warn("Caller {} lacks role {}", conduit::schema::to_hex(caller),
               conduit::schema::to_string(role));
  return conduit::common::make_error(
      conduit::schema::transaction_error_code::unauthorized,
      "caller lacks role " + std::string{conduit::schema::to_string(role)});
}

conduit::schema::transaction_result_t access_control::upsert_role_assignment(
    const conduit::schema::address_t& caller,
    const conduit::schema::upsert_role_assignment_t& assignment) {
  if (auto denied = require_role(conduit::schema::role_id_t::admin, caller)) {
    return *denied;
  }

  auto key = conduit::schema::key::make_role_key(encoder_, assignment.role,
                                                 assignment.account);
  if (assignment.enabled) {
    state_.put(encoder_, key, true);
  } else {
    state_.erase(key);
  }
  spdlog::info("Role {} {} for {}", conduit::schema::to_string(assignment.role),
               assignment.enabled ? "granted" : "revoked",
               conduit::schema::to_hex(assignment.account));

  auto result = conduit::schema::transaction_result_t{};
  result.events.push_back(conduit::common::make_event(
      "role_assignment_updated",
      {{"role", std::string{conduit::schema::to_string(assignment.role)}},
       {"account", conduit::schema::to_hex(assignment.account)},
       {"enabled", assignment.enabled ? "true" : "false"}}));
  return result;
}

void access_control::grant(const conduit::schema::role_id_t role,
                           const conduit::schema::address_t& account) {
  auto key = conduit::schema::key::make_role_key(encoder_, role, account);
  state_.put(encoder_, key, true);
}

}  // namespace conduit::access
