#pragma once

#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/relay/router.hpp>
#include <conduit/schema/app_info.hpp>
#include <conduit/schema/block_result.hpp>
#include <conduit/schema/commit_result.hpp>
#include <conduit/schema/encoding/scale/encoder.hpp>
#include <conduit/schema/initialize.hpp>
#include <conduit/schema/primitives.hpp>
#include <conduit/schema/query_result.hpp>
#include <conduit/schema/transaction.hpp>
#include <conduit/schema/transaction_result.hpp>
#include <conduit/schema/unit_info.hpp>
#include <conduit/storage/overlay.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::execution {

/// Replaceable signature check; returns true when `signature` is valid for
/// `message` under `signer`.
using signature_verifier_t =
    std::function<bool(const conduit::schema::bytes_view_t& message,
                       const conduit::schema::signer_id_t& signer,
                       const conduit::schema::signature_t& signature)>;

/// Bytes a transaction signer signs: the envelope without its signature.
conduit::schema::bytes_t make_signing_bytes(
    conduit::schema::encoding::scale_encoder_t& encoder,
    const conduit::schema::transaction_t& tx);

/// chain_id = blake3(chain_name).
conduit::schema::hash32_t make_chain_id(std::string_view chain_name);

/// Deterministic relay unit driven by the RPC server.
///
/// The engine validates transaction envelopes, executes payload operations
/// against a per-transaction overlay, and persists finalized blocks on
/// commit. Every public call is serialized by one mutex.
class engine final {
 public:
  /// `chain_name` derives the chain id (blake3 of the name).
  /// `require_strict_crypto` enables OpenSSL signature verification; when
  /// false, signatures are checked only by an installed verifier.
  explicit engine(
      conduit::schema::encoding::scale_encoder_t& encoder,
      conduit::storage::storage<conduit::storage::rocksdb_storage_tag>& storage,
      conduit::relay::router& router,
      const conduit::dispatch::dispatch_table& table,
      std::string_view chain_name = "conduit-local",
      bool require_strict_crypto = true);

  /// Run the one-time provisioning initializer and persist it immediately.
  ///
  /// Fails with already_initialized on every call after the first.
  conduit::schema::transaction_result_t initialize(
      const conduit::schema::initialize_t& args);

  bool initialized() const;

  /// Admit a transaction (decode + envelope validation against committed
  /// state). Never mutates state.
  conduit::schema::transaction_result_t check_transaction(
      const conduit::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block and compute its resulting state_root.
  ///
  /// Transactions run in order, each atomically: a failed transaction leaves
  /// no state change and does not consume its nonce.
  conduit::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<conduit::schema::bytes_t>& txs);

  /// Persist the latest finalized block in one RocksDB write batch.
  conduit::schema::commit_result_t commit();

  conduit::schema::app_info_t info() const;

  /// Read-path query against committed state by route.
  conduit::schema::query_result_t query(
      std::string_view path,
      const conduit::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  void set_signature_verifier(signature_verifier_t verifier);

  const conduit::schema::hash32_t& chain_id() const;

 private:
  conduit::schema::transaction_result_t validate_transaction(
      const conduit::schema::transaction_t& tx,
      const conduit::storage::overlay& state,
      std::string_view codespace) const;

  conduit::schema::transaction_result_t execute_operation(
      const conduit::schema::transaction_t& tx,
      const conduit::schema::unit_info_t& unit,
      conduit::storage::overlay& state,
      uint64_t height);

  std::optional<conduit::schema::unit_info_t> load_unit(
      const conduit::storage::overlay& state) const;

  void load_persisted_state();

  mutable std::mutex mutex_;
  conduit::schema::encoding::scale_encoder_t& encoder_;
  conduit::storage::storage<conduit::storage::rocksdb_storage_tag>& storage_;
  conduit::relay::router& router_;
  const conduit::dispatch::dispatch_table& table_;
  std::unique_ptr<conduit::storage::overlay> pending_block_;
  int64_t last_committed_height_{};
  conduit::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  conduit::schema::hash32_t pending_state_root_{};
  conduit::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace conduit::execution
