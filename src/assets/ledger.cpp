#include <conduit/assets/ledger.hpp>

#include <conduit/schema/key/engine_keys.hpp>
#include <limits>

namespace conduit::assets {

ledger::ledger(conduit::schema::encoding::scale_encoder_t& encoder,
               conduit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

conduit::schema::amount_t ledger::balance_of(
    const conduit::schema::address_t& asset,
    const conduit::schema::address_t& owner) const {
  auto key = conduit::schema::key::make_balance_key(encoder_, asset, owner);
  return state_.get<conduit::schema::amount_t>(encoder_, key)
      .value_or(conduit::schema::amount_t{0});
}

conduit::schema::amount_t ledger::allowance(
    const conduit::schema::address_t& asset,
    const conduit::schema::address_t& owner,
    const conduit::schema::address_t& spender) const {
  auto key =
      conduit::schema::key::make_allowance_key(encoder_, asset, owner, spender);
  return state_.get<conduit::schema::amount_t>(encoder_, key)
      .value_or(conduit::schema::amount_t{0});
}

void ledger::approve(const conduit::schema::address_t& asset,
                     const conduit::schema::address_t& owner,
                     const conduit::schema::address_t& spender,
                     const conduit::schema::amount_t& amount) {
  auto key =
      conduit::schema::key::make_allowance_key(encoder_, asset, owner, spender);
  if (amount == 0) {
    state_.erase(key);
    return;
  }
  state_.put(encoder_, key, amount);
}

bool ledger::transfer(const conduit::schema::address_t& asset,
                      const conduit::schema::address_t& from,
                      const conduit::schema::address_t& to,
                      const conduit::schema::amount_t& amount) {
  auto from_balance = balance_of(asset, from);
  if (from_balance < amount) {
    return false;
  }
  if (from == to || amount == 0) {
    return true;
  }
  auto to_balance = balance_of(asset, to);
  if (std::numeric_limits<conduit::schema::amount_t>::max() - to_balance <
      amount) {
    return false;
  }
  set_balance(asset, from, from_balance - amount);
  set_balance(asset, to, to_balance + amount);
  return true;
}

bool ledger::transfer_from(const conduit::schema::address_t& asset,
                           const conduit::schema::address_t& spender,
                           const conduit::schema::address_t& from,
                           const conduit::schema::address_t& to,
                           const conduit::schema::amount_t& amount) {
  auto allowed = allowance(asset, from, spender);
  if (allowed < amount) {
    return false;
  }
  if (!transfer(asset, from, to, amount)) {
    return false;
  }
  approve(asset, from, spender, allowed - amount);
  return true;
}

bool ledger::mint(const conduit::schema::address_t& asset,
                  const conduit::schema::address_t& to,
                  const conduit::schema::amount_t& amount) {
  auto balance = balance_of(asset, to);
  if (std::numeric_limits<conduit::schema::amount_t>::max() - balance <
      amount) {
    return false;
  }
  set_balance(asset, to, balance + amount);
  return true;
}

void ledger::set_balance(const conduit::schema::address_t& asset,
                         const conduit::schema::address_t& owner,
                         const conduit::schema::amount_t& amount) {
  auto key = conduit::schema::key::make_balance_key(encoder_, asset, owner);
  if (amount == 0) {
    state_.erase(key);
    return;
  }
  state_.put(encoder_, key, amount);
}

}  // namespace conduit::assets
