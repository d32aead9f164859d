#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/unit_info.hpp>
#include <conduit/storage/overlay.hpp>
#include <optional>
#include <string>
#include <string_view>

// Token ownership facet driven by cross-chain messages.
//
// mint(address,uint256)  self_only; reached through inbound delivery or
//                        recovery. Fails for the zero address and for an
//                        already minted token id.
// burn(uint256)          external; only the current owner may burn.
// burn_and_mint(uint64,address,address,uint256)
//                        external; burns the caller's token and sends
//                        mint(to, token_id) to the receiver unit on the
//                        destination chain. A failed send restores the token.
//
// Collection name and symbol come from the unit's provisioning metadata; a
// token URI is the base URI followed by the decimal token id.
namespace conduit::facets::cross_chain_mint {

inline constexpr auto kFacetName = std::string_view{"cross_chain_mint"};
inline constexpr auto kMintSignature =
    std::string_view{"mint(address,uint256)"};
inline constexpr auto kBurnSignature = std::string_view{"burn(uint256)"};
inline constexpr auto kBurnAndMintSignature =
    std::string_view{"burn_and_mint(uint64,address,address,uint256)"};

void register_functions(conduit::dispatch::dispatch_table& table);

std::optional<conduit::schema::address_t> owner_of(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::storage::overlay& state,
    const conduit::schema::amount_t& token_id);

/// nullopt when the token is not minted.
std::optional<std::string> token_uri(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::storage::overlay& state,
    const conduit::schema::unit_info_t& unit,
    const conduit::schema::amount_t& token_id);

/// Call data for mint(to, token_id).
conduit::schema::bytes_t make_mint_call(const conduit::schema::address_t& to,
                                        const conduit::schema::amount_t& token_id);

/// Call data for burn(token_id).
conduit::schema::bytes_t make_burn_call(const conduit::schema::amount_t& token_id);

conduit::schema::bytes_t make_burn_and_mint_call(
    conduit::schema::chain_selector_t destination,
    const conduit::schema::address_t& receiver,
    const conduit::schema::address_t& to,
    const conduit::schema::amount_t& token_id);

}  // namespace conduit::facets::cross_chain_mint
