#pragma once

#include <conduit/execution/engine.hpp>
#include <conduit/v1/relay.grpc.pb.h>

namespace conduit::rpc {

/// Callback listener exposing the execution engine over gRPC.
///
/// - CheckTransaction: admission check for one tx; no state mutation.
/// - FinalizeBlock: execute ordered txs, return results and state root.
/// - Commit: persist the finalized block.
/// - Info/Query: read committed state.
struct listener final : public conduit::v1::Relay::CallbackService {
  explicit listener(conduit::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* CheckTransaction(
      grpc::CallbackServerContext* context,
      const conduit::v1::CheckTransactionRequest* request,
      conduit::v1::TransactionResult* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const conduit::v1::FinalizeBlockRequest* request,
      conduit::v1::FinalizeBlockResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const conduit::v1::CommitRequest* request,
      conduit::v1::CommitResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const conduit::v1::InfoRequest* request,
      conduit::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const conduit::v1::QueryRequest* request,
      conduit::v1::QueryResponse* response) override final;

  conduit::execution::engine& execution_engine_;
};

/// Copies an engine result into its wire form.
void populate_transaction_result(
    const conduit::schema::transaction_result_t& source,
    conduit::v1::TransactionResult* destination);

}  // namespace conduit::rpc
