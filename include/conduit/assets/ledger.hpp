#pragma once

#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/storage/overlay.hpp>

namespace conduit::assets {

/// Balances and allowances per (asset, account). The native asset is
/// kNativeAsset; every other address names an ERC-style asset.
///
/// Mutators return false and leave state untouched when funds or allowance
/// fall short.
class ledger final {
 public:
  ledger(conduit::schema::encoding::scale_encoder_t& encoder,
         conduit::storage::overlay& state);

  conduit::schema::amount_t balance_of(
      const conduit::schema::address_t& asset,
      const conduit::schema::address_t& owner) const;

  conduit::schema::amount_t allowance(
      const conduit::schema::address_t& asset,
      const conduit::schema::address_t& owner,
      const conduit::schema::address_t& spender) const;

  void approve(const conduit::schema::address_t& asset,
               const conduit::schema::address_t& owner,
               const conduit::schema::address_t& spender,
               const conduit::schema::amount_t& amount);

  bool transfer(const conduit::schema::address_t& asset,
                const conduit::schema::address_t& from,
                const conduit::schema::address_t& to,
                const conduit::schema::amount_t& amount);

  bool transfer_from(const conduit::schema::address_t& asset,
                     const conduit::schema::address_t& spender,
                     const conduit::schema::address_t& from,
                     const conduit::schema::address_t& to,
                     const conduit::schema::amount_t& amount);

  bool mint(const conduit::schema::address_t& asset,
            const conduit::schema::address_t& to,
            const conduit::schema::amount_t& amount);

 private:
  void set_balance(const conduit::schema::address_t& asset,
                   const conduit::schema::address_t& owner,
                   const conduit::schema::amount_t& amount);

  conduit::schema::encoding::scale_encoder_t& encoder_;
  conduit::storage::overlay& state_;
};

}  // namespace conduit::assets
