#include <spdlog/spdlog.h>
#include <conduit/rpc/server.hpp>
#include <string>
#include <vector>

using namespace conduit::rpc;
using namespace conduit::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

}  // namespace

namespace conduit::rpc {

void populate_transaction_result(const transaction_result_t& source,
                                 conduit::v1::TransactionResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* attr = out->add_attributes();
      attr->set_key(attribute.key);
      attr->set_value(attribute.value);
      attr->set_index(attribute.index);
    }
  }
}

}  // namespace conduit::rpc

listener::listener(conduit::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::CheckTransaction(
    grpc::CallbackServerContext* context,
    const conduit::v1::CheckTransactionRequest* request,
    conduit::v1::TransactionResult* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  populate_transaction_result(check, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const conduit::v1::FinalizeBlockRequest* request,
    conduit::v1::FinalizeBlockResponse* response) {
  auto txs = std::vector<bytes_t>{};
  txs.reserve(request->txs_size());
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(request->height(), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_transaction_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(
      bytes_view_t{execution.state_root.data(), execution.state_root.size()}));
  spdlog::debug("Finalized height {} with {} tx(s)", request->height(),
                txs.size());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const conduit::v1::CommitRequest* /*request*/,
    conduit::v1::CommitResponse* response) {
  auto commit = execution_engine_.commit();
  response->set_committed_height(commit.committed_height);
  response->set_state_root(make_string(
      bytes_view_t{commit.state_root.data(), commit.state_root.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const conduit::v1::InfoRequest* /*request*/,
    conduit::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(
      make_string(bytes_view_t{info.last_block_state_root.data(),
                               info.last_block_state_root.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const conduit::v1::QueryRequest* request,
    conduit::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
