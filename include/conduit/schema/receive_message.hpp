#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>

// Schema type: receive message.
// Relay workflow: Router delivery of a raw inbound wire message. The bytes are
// decoded and validated by the message codec, never trusted as-is.
namespace conduit::schema {

template <uint16_t Version>
struct receive_message;

template <>
struct receive_message<1> final {
  uint16_t version{1};
  bytes_t message;
};

using receive_message_t = receive_message<1>;

}  // namespace conduit::schema
