#pragma once

#include <conduit/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Relay workflow: Emitted record (message_sent, message_received,
// message_failed, message_recovered, configuration changes) attached to a
// transaction result for indexers and relayers.
namespace conduit::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace conduit::schema
