#pragma once

#include <conduit/schema/error_state.hpp>
#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: failure record.
// Relay workflow: Durable entry of the failure ledger. Its existence is the
// only signal that an inbound message is pending recovery.
namespace conduit::schema {

template <uint16_t Version>
struct failure_record;

template <>
struct failure_record<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  error_state_t error_state{error_state_t::basic};
  uint32_t code{};
  bytes_t reason;
  chain_selector_t source_chain_selector{};
  bytes_t sender;
  uint64_t failed_at_height{};
};

using failure_record_t = failure_record<1>;

}  // namespace conduit::schema
