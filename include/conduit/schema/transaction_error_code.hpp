#pragma once

#include <conduit/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

namespace conduit::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  not_initialized = 7,
  already_initialized = 8,
  unauthorized = 10,
  invalid_router = 11,
  destination_chain_not_allowlisted = 12,
  destination_chain_not_supported = 13,
  source_chain_not_allowed = 14,
  sender_not_allowed = 15,
  insufficient_balance = 16,
  fee_quote_failed = 17,
  relay_submission_failed = 18,
  malformed_payload = 19,
  message_not_failed = 20,
  message_already_failed = 21,
  message_application_failed = 22,
  unknown_selector = 23,
  facet_call_failed = 24,
  invalid_argument = 25,
};

inline constexpr auto kTransactionErrorCodeNames =
    make_enum_names<transaction_error_code>(
    std::pair{transaction_error_code::invalid_transaction,
              "invalid_transaction"},
    std::pair{transaction_error_code::unsupported_transaction_version,
              "unsupported_transaction_version"},
    std::pair{transaction_error_code::invalid_chain_id, "invalid_chain_id"},
    std::pair{transaction_error_code::invalid_nonce, "invalid_nonce"},
    std::pair{transaction_error_code::invalid_signature_type,
              "invalid_signature_type"},
    std::pair{transaction_error_code::signature_verification_failed,
              "signature_verification_failed"},
    std::pair{transaction_error_code::not_initialized, "not_initialized"},
    std::pair{transaction_error_code::already_initialized,
              "already_initialized"},
    std::pair{transaction_error_code::unauthorized, "unauthorized"},
    std::pair{transaction_error_code::invalid_router, "invalid_router"},
    std::pair{transaction_error_code::destination_chain_not_allowlisted,
              "destination_chain_not_allowlisted"},
    std::pair{transaction_error_code::destination_chain_not_supported,
              "destination_chain_not_supported"},
    std::pair{transaction_error_code::source_chain_not_allowed,
              "source_chain_not_allowed"},
    std::pair{transaction_error_code::sender_not_allowed, "sender_not_allowed"},
    std::pair{transaction_error_code::insufficient_balance,
              "insufficient_balance"},
    std::pair{transaction_error_code::fee_quote_failed, "fee_quote_failed"},
    std::pair{transaction_error_code::relay_submission_failed,
              "relay_submission_failed"},
    std::pair{transaction_error_code::malformed_payload, "malformed_payload"},
    std::pair{transaction_error_code::message_not_failed, "message_not_failed"},
    std::pair{transaction_error_code::message_already_failed,
              "message_already_failed"},
    std::pair{transaction_error_code::message_application_failed,
              "message_application_failed"},
    std::pair{transaction_error_code::unknown_selector, "unknown_selector"},
    std::pair{transaction_error_code::facet_call_failed, "facet_call_failed"},
    std::pair{transaction_error_code::invalid_argument, "invalid_argument"});

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return kTransactionErrorCodeNames.name_of(value);
}

}  // namespace conduit::schema
