#include <conduit/relay/codec.hpp>

#include <conduit/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <iterator>

namespace conduit::relay::codec {

conduit::schema::outbound_message_t encode(
    const conduit::schema::address_t& receiver,
    const conduit::schema::bytes_t& payload,
    const conduit::schema::address_t& token,
    const conduit::schema::amount_t& amount,
    const conduit::schema::address_t& fee_token,
    const uint64_t gas_limit) {
  auto message = conduit::schema::outbound_message_t{};
  message.receiver = conduit::schema::make_bytes(receiver);
  message.data = payload;
  message.token_amounts.push_back(conduit::schema::token_amount_t{
      .token = conduit::schema::make_bytes(token), .amount = amount});
  message.fee_token = fee_token;
  message.extra_args =
      encode_extra_args(conduit::schema::extra_args_v1_t{.gas_limit = gas_limit});
  return message;
}

conduit::schema::bytes_t encode_inbound(
    const conduit::schema::inbound_message_t& message) {
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  return encoder.encode(message);
}

std::optional<conduit::schema::inbound_message_t> decode(
    const conduit::schema::bytes_view_t& raw,
    std::string& error) {
  if (raw.empty()) {
    error = "empty message";
    return std::nullopt;
  }
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  auto message =
      encoder.try_decode<conduit::schema::inbound_message_t>(raw);
  if (!message) {
    error = "not a SCALE inbound message";
    return std::nullopt;
  }
  // The decoder stops at the end of the struct; re-encoding exposes trailing
  // bytes and non-canonical lengths.
  if (encoder.encode(*message).size() != raw.size()) {
    error = "non-canonical encoding or trailing bytes";
    return std::nullopt;
  }
  if (message->version != 1) {
    error = "unsupported message version " + std::to_string(message->version);
    return std::nullopt;
  }
  if (message->sender.size() != conduit::schema::address_t{}.size()) {
    error = "sender must be 20 bytes";
    return std::nullopt;
  }
  if (message->token_amounts.size() > 1) {
    error = "at most one token amount is accepted";
    return std::nullopt;
  }
  for (const auto& token_amount : message->token_amounts) {
    if (token_amount.token.size() != conduit::schema::address_t{}.size()) {
      error = "token must be 20 bytes";
      return std::nullopt;
    }
  }
  if (message->data.size() < conduit::schema::selector_t{}.size()) {
    error = "call data shorter than a selector";
    return std::nullopt;
  }
  return message;
}

conduit::schema::bytes_t encode_extra_args(
    const conduit::schema::extra_args_v1_t& args) {
  auto out = conduit::schema::bytes_t{std::begin(conduit::schema::kExtraArgsV1Tag),
                                      std::end(conduit::schema::kExtraArgsV1Tag)};
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  encoder.encode(args, out);
  return out;
}

std::optional<conduit::schema::extra_args_v1_t> decode_extra_args(
    const conduit::schema::bytes_view_t& raw) {
  const auto& tag = conduit::schema::kExtraArgsV1Tag;
  if (raw.size() < tag.size() ||
      !std::equal(std::begin(tag), std::end(tag), std::begin(raw))) {
    return std::nullopt;
  }
  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  return encoder.try_decode<conduit::schema::extra_args_v1_t>(
      raw.subspan(tag.size()));
}

std::optional<call_data> split_call_data(
    const conduit::schema::bytes_view_t& data) {
  auto out = call_data{};
  if (data.size() < out.selector.size()) {
    return std::nullopt;
  }
  std::copy_n(std::begin(data), out.selector.size(), std::begin(out.selector));
  out.arguments = data.subspan(out.selector.size());
  return out;
}

conduit::schema::bytes_t make_call_data(
    const conduit::schema::selector_t& selector,
    const conduit::schema::bytes_t& arguments) {
  auto out = conduit::schema::bytes_t{std::begin(selector), std::end(selector)};
  out.insert(std::end(out), std::begin(arguments), std::end(arguments));
  return out;
}

}  // namespace conduit::relay::codec
