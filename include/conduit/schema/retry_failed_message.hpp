#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: retry failed message.
// Relay workflow: Operator recovery of a failure ledger entry with a
// replacement call data payload.
namespace conduit::schema {

template <uint16_t Version>
struct retry_failed_message;

template <>
struct retry_failed_message<1> final {
  uint16_t version{1};
  message_id_t message_id{};
  bytes_t data;
};

using retry_failed_message_t = retry_failed_message<1>;

}  // namespace conduit::schema
