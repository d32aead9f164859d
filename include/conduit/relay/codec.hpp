#pragma once

#include <conduit/schema/extra_args.hpp>
#include <conduit/schema/inbound_message.hpp>
#include <conduit/schema/outbound_message.hpp>
#include <conduit/schema/primitives.hpp>
#include <optional>
#include <string>

// Wire layout of relay messages.
//
// Outbound: outbound_message_t with exactly one token amount and extra args
// `kExtraArgsV1Tag || SCALE(extra_args_v1_t)`.
// Inbound: canonical SCALE inbound_message_t, version 1, 20-byte sender,
// at most one token amount with a 20-byte token, and call data
// `selector(4) || SCALE(arguments)`.
namespace conduit::relay::codec {

conduit::schema::outbound_message_t encode(
    const conduit::schema::address_t& receiver,
    const conduit::schema::bytes_t& payload,
    const conduit::schema::address_t& token,
    const conduit::schema::amount_t& amount,
    const conduit::schema::address_t& fee_token,
    uint64_t gas_limit = conduit::schema::kDefaultGasLimit);

conduit::schema::bytes_t encode_inbound(
    const conduit::schema::inbound_message_t& message);

/// Decode and validate raw inbound bytes. On failure `error` names the first
/// violated rule.
std::optional<conduit::schema::inbound_message_t> decode(
    const conduit::schema::bytes_view_t& raw,
    std::string& error);

conduit::schema::bytes_t encode_extra_args(
    const conduit::schema::extra_args_v1_t& args);
std::optional<conduit::schema::extra_args_v1_t> decode_extra_args(
    const conduit::schema::bytes_view_t& raw);

struct call_data final {
  conduit::schema::selector_t selector;
  conduit::schema::bytes_view_t arguments;
};

std::optional<call_data> split_call_data(
    const conduit::schema::bytes_view_t& data);

conduit::schema::bytes_t make_call_data(
    const conduit::schema::selector_t& selector,
    const conduit::schema::bytes_t& arguments);

}  // namespace conduit::relay::codec
