#pragma once

#include <conduit/assets/ledger.hpp>
#include <conduit/blake3/hash.hpp>
#include <conduit/relay/router.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>

#include <optional>
#include <set>
#include <vector>

namespace conduit::testing {

/// Router double that records every submission and the allowances the unit
/// granted at the moment of the call. Funds are not moved.
class recording_router final : public conduit::relay::router {
 public:
  struct submission final {
    conduit::schema::chain_selector_t destination{};
    conduit::schema::outbound_message_t message;
    conduit::schema::address_t sender{};
    conduit::schema::amount_t fee_allowance{};
    conduit::schema::amount_t token_allowance{};
  };

  std::set<conduit::schema::chain_selector_t> supported{7};
  std::optional<conduit::schema::amount_t> fee{
      conduit::schema::amount_t{100}};
  bool refuse_submission{false};
  bool return_zero_id{false};
  std::vector<submission> submissions;

  bool is_chain_supported(
      const conduit::schema::chain_selector_t destination) const override {
    return supported.contains(destination);
  }

  std::optional<conduit::schema::amount_t> get_fee(
      conduit::schema::chain_selector_t,
      const conduit::schema::outbound_message_t&) const override {
    return fee;
  }

  std::optional<conduit::schema::message_id_t> ccip_send(
      conduit::relay::router_call& call,
      const conduit::schema::chain_selector_t destination,
      const conduit::schema::outbound_message_t& message) override {
    if (refuse_submission) {
      return std::nullopt;
    }
    auto record = submission{.destination = destination,
                             .message = message,
                             .sender = call.sender};
    record.fee_allowance =
        call.ledger.allowance(message.fee_token, call.sender, call.router);
    if (!message.token_amounts.empty()) {
      auto token = conduit::schema::try_make_address(
          conduit::schema::bytes_view_t{message.token_amounts[0].token.data(),
                                        message.token_amounts[0].token.size()});
      if (token) {
        record.token_allowance =
            call.ledger.allowance(*token, call.sender, call.router);
      }
    }
    submissions.push_back(record);
    if (return_zero_id) {
      return conduit::schema::message_id_t{};
    }
    auto encoder = conduit::schema::encoding::scale_encoder_t{};
    auto material = encoder.encode(static_cast<uint64_t>(submissions.size()));
    return conduit::blake3::hash(
        conduit::schema::bytes_view_t{material.data(), material.size()});
  }
};

}  // namespace conduit::testing
