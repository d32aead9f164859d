#pragma once

#include <gtest/gtest.h>

#include <conduit/execution/engine.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace conduit::testing {

inline conduit::schema::transaction_t make_transaction(
    const conduit::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const conduit::schema::signer_id_t& signer,
    const conduit::schema::transaction_payload_t& payload) {
  return conduit::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = conduit::schema::ed25519_signature_t{}};
}

inline conduit::schema::bytes_t encode_transaction(
    const conduit::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline conduit::schema::hash32_t chain_id_from_engine(
    conduit::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  const auto decoded = encoder.decode<std::tuple<
      int64_t, conduit::schema::hash32_t, conduit::schema::hash32_t>>(
      conduit::schema::bytes_view_t{query.value.data(), query.value.size()});
  return std::get<2>(decoded);
}

/// Finalizes and commits a one-transaction block.
inline conduit::schema::transaction_result_t finalize_single(
    conduit::execution::engine& engine,
    const uint64_t height,
    const conduit::schema::transaction_t& tx) {
  auto block = engine.finalize_block(height, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  (void)engine.commit();
  return result;
}

/// Decodes a successful query value, or nullopt on a non-zero code.
template <typename T>
std::optional<T> query_value(conduit::execution::engine& engine,
                             const std::string_view path,
                             const conduit::schema::bytes_t& key = {}) {
  auto result = engine.query(path, view(key));
  if (result.code != 0) {
    return std::nullopt;
  }
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(view(result.value));
}

inline const conduit::schema::transaction_event_t* find_event(
    const conduit::schema::transaction_result_t& result,
    const std::string_view type) {
  for (const auto& event : result.events) {
    if (event.type == type) {
      return &event;
    }
  }
  return nullptr;
}

inline std::optional<std::string> event_attribute(
    const conduit::schema::transaction_event_t& event,
    const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return std::nullopt;
}

}  // namespace conduit::testing
