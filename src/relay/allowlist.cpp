#include <conduit/relay/allowlist.hpp>

#include <conduit/access/access_control.hpp>
#include <conduit/common/result.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

namespace conduit::relay {

allowlist::allowlist(context& ctx) : ctx_{ctx} {}

bool allowlist::is_destination_allowed(
    const conduit::schema::chain_selector_t chain) const {
  return ctx_.state.contains(
      conduit::schema::key::make_allow_destination_key(ctx_.encoder, chain));
}

bool allowlist::is_source_allowed(
    const conduit::schema::chain_selector_t chain) const {
  return ctx_.state.contains(
      conduit::schema::key::make_allow_source_key(ctx_.encoder, chain));
}

bool allowlist::is_sender_allowed(
    const conduit::schema::chain_selector_t chain,
    const conduit::schema::address_t& sender) const {
  return ctx_.state.contains(conduit::schema::key::make_allow_sender_key(
      ctx_.encoder, chain, sender));
}

conduit::schema::transaction_result_t allowlist::set_destination_allowed(
    const conduit::schema::address_t& caller,
    const conduit::schema::chain_selector_t chain,
    const bool allowed) {
  return set_entry(
      caller,
      conduit::schema::key::make_allow_destination_key(ctx_.encoder, chain),
      allowed, "destination", std::to_string(chain));
}

conduit::schema::transaction_result_t allowlist::set_source_allowed(
    const conduit::schema::address_t& caller,
    const conduit::schema::chain_selector_t chain,
    const bool allowed) {
  return set_entry(
      caller, conduit::schema::key::make_allow_source_key(ctx_.encoder, chain),
      allowed, "source", std::to_string(chain));
}

conduit::schema::transaction_result_t allowlist::set_sender_allowed(
    const conduit::schema::address_t& caller,
    const conduit::schema::chain_selector_t chain,
    const conduit::schema::address_t& sender,
    const bool allowed) {
  return set_entry(caller,
                   conduit::schema::key::make_allow_sender_key(ctx_.encoder,
                                                               chain, sender),
                   allowed, "sender",
                   std::to_string(chain) + "/" +
                       conduit::schema::to_hex(sender));
}

conduit::schema::transaction_result_t allowlist::set_entry(
    const conduit::schema::address_t& caller,
    const conduit::schema::bytes_t& key,
    const bool allowed,
    const std::string_view list,
    std::string description) {
  auto roles = conduit::access::access_control{ctx_.encoder, ctx_.state};
  if (auto denied =
          roles.require_role(conduit::schema::role_id_t::admin, caller)) {
    return *denied;
  }

  if (allowed) {
    ctx_.state.put(ctx_.encoder, key, true);
  } else {
    ctx_.state.erase(key);
  }
  spdlog::info("Allowlist {} {} -> {}", list, description, allowed);

  auto result = conduit::schema::transaction_result_t{};
  result.events.push_back(conduit::common::make_event(
      "allowlist_updated", {{"list", std::string{list}},
                            {"entry", std::move(description)},
                            {"allowed", allowed ? "true" : "false"}}));
  return result;
}

}  // namespace conduit::relay
