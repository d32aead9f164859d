#include <conduit/relay/router_registry.hpp>

#include <conduit/access/access_control.hpp>
#include <conduit/common/result.hpp>
#include <conduit/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

namespace conduit::relay {

router_registry::router_registry(context& ctx) : ctx_{ctx} {}

std::optional<conduit::schema::address_t> router_registry::current() const {
  return ctx_.state.get<conduit::schema::address_t>(
      ctx_.encoder, conduit::schema::key::make_router_key(ctx_.encoder));
}

conduit::schema::transaction_result_t router_registry::set(
    const conduit::schema::address_t& caller,
    const conduit::schema::address_t& router) {
  auto roles = conduit::access::access_control{ctx_.encoder, ctx_.state};
  if (auto denied =
          roles.require_role(conduit::schema::role_id_t::admin, caller)) {
    return *denied;
  }
  if (conduit::schema::is_zero(router)) {
    return conduit::common::make_error(
        conduit::schema::transaction_error_code::invalid_argument,
        "router address must be non-zero");
  }

  auto previous = current();
  ctx_.state.put(ctx_.encoder,
                 conduit::schema::key::make_router_key(ctx_.encoder), router);
  spdlog::info("Router set to {}", conduit::schema::to_hex(router));

  auto result = conduit::schema::transaction_result_t{};
  result.events.push_back(conduit::common::make_event(
      "router_updated",
      {{"previous",
        previous ? conduit::schema::to_hex(*previous) : std::string{}},
       {"router", conduit::schema::to_hex(router)}}));
  return result;
}

void router_registry::initialize(const conduit::schema::address_t& router) {
  if (conduit::schema::is_zero(router)) {
    spdlog::warn("No router registered at provisioning");
    return;
  }
  ctx_.state.put(ctx_.encoder,
                 conduit::schema::key::make_router_key(ctx_.encoder), router);
}

}  // namespace conduit::relay
