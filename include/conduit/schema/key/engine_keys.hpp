#pragma once

#include <conduit/schema/primitives.hpp>
#include <conduit/schema/role_id.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Relay workflow: Canonical key prefixes and key codecs for unit state,
// allowlists, the failure ledger, the asset ledger and the router outbox.
namespace conduit::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kUnitKeyPrefix{"SYS|STATE|UNIT|"};
inline constexpr std::string_view kRoleKeyPrefix{"SYS|STATE|ROLE|"};
inline constexpr std::string_view kRouterKeyPrefix{"SYS|STATE|ROUTER|"};
inline constexpr std::string_view kAllowDestinationKeyPrefix{
    "SYS|STATE|ALLOW|DEST|"};
inline constexpr std::string_view kAllowSourceKeyPrefix{
    "SYS|STATE|ALLOW|SOURCE|"};
inline constexpr std::string_view kAllowSenderKeyPrefix{
    "SYS|STATE|ALLOW|SENDER|"};
inline constexpr std::string_view kFailedMessageKeyPrefix{
    "SYS|STATE|FAILED|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kAllowanceKeyPrefix{
    "SYS|STATE|ALLOWANCE|"};
inline constexpr std::string_view kOutboxKeyPrefix{"SYS|STATE|OUTBOX|"};
inline constexpr std::string_view kOutboxSeqKeyPrefix{
    "SYS|STATE|OUTBOX_SEQ|"};
inline constexpr std::string_view kFacetMintKeyPrefix{
    "SYS|STATE|FACET|MINT|"};

template <typename Encoder, typename T>
conduit::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
conduit::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
conduit::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const conduit::schema::signer_id_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

template <typename Encoder>
conduit::schema::bytes_t make_unit_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kUnitKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
conduit::schema::bytes_t make_role_key(
    Encoder& encoder,
    const conduit::schema::role_id_t role,
    const conduit::schema::address_t& account) {
  return make_prefixed_key(encoder, kRoleKeyPrefix, std::tuple{role, account});
}

template <typename Encoder>
conduit::schema::bytes_t make_router_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kRouterKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
conduit::schema::bytes_t make_allow_destination_key(
    Encoder& encoder,
    const conduit::schema::chain_selector_t chain) {
  return make_prefixed_key(encoder, kAllowDestinationKeyPrefix, chain);
}

template <typename Encoder>
conduit::schema::bytes_t make_allow_source_key(
    Encoder& encoder,
    const conduit::schema::chain_selector_t chain) {
  return make_prefixed_key(encoder, kAllowSourceKeyPrefix, chain);
}

template <typename Encoder>
conduit::schema::bytes_t make_allow_sender_key(
    Encoder& encoder,
    const conduit::schema::chain_selector_t chain,
    const conduit::schema::address_t& sender) {
  return make_prefixed_key(encoder, kAllowSenderKeyPrefix,
                           std::tuple{chain, sender});
}

template <typename Encoder>
conduit::schema::bytes_t make_failed_message_key(
    Encoder& encoder,
    const conduit::schema::message_id_t& message_id) {
  return make_prefixed_key(encoder, kFailedMessageKeyPrefix, message_id);
}

template <typename Encoder>
conduit::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const conduit::schema::address_t& asset,
    const conduit::schema::address_t& owner) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{asset, owner});
}

template <typename Encoder>
conduit::schema::bytes_t make_allowance_key(
    Encoder& encoder,
    const conduit::schema::address_t& asset,
    const conduit::schema::address_t& owner,
    const conduit::schema::address_t& spender) {
  return make_prefixed_key(encoder, kAllowanceKeyPrefix,
                           std::tuple{asset, owner, spender});
}

template <typename Encoder>
conduit::schema::bytes_t make_outbox_key(Encoder& encoder,
                                         const uint64_t sequence) {
  return make_prefixed_key(encoder, kOutboxKeyPrefix, sequence);
}

template <typename Encoder>
conduit::schema::bytes_t make_outbox_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kOutboxSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
conduit::schema::bytes_t make_mint_owner_key(
    Encoder& encoder,
    const conduit::schema::amount_t& token_id) {
  return make_prefixed_key(encoder, kFacetMintKeyPrefix, token_id);
}

template <typename Encoder>
std::optional<conduit::schema::message_id_t> parse_failed_message_key(
    Encoder& encoder,
    const conduit::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, conduit::schema::message_id_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kFailedMessageKeyPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace conduit::schema::key
