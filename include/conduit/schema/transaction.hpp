#pragma once
#include <conduit/schema/call_facet.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/receive_message.hpp>
#include <conduit/schema/retry_failed_message.hpp>
#include <conduit/schema/send_message.hpp>
#include <conduit/schema/set_destination_chain.hpp>
#include <conduit/schema/set_router.hpp>
#include <conduit/schema/set_sender.hpp>
#include <conduit/schema/set_source_chain.hpp>
#include <conduit/schema/upsert_role_assignment.hpp>
#include <variant>

namespace conduit::schema {

using transaction_payload_t = std::variant<send_message_t,
                                           receive_message_t,
                                           retry_failed_message_t,
                                           set_destination_chain_t,
                                           set_source_chain_t,
                                           set_sender_t,
                                           set_router_t,
                                           upsert_role_assignment_t,
                                           call_facet_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace conduit::schema
