#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <conduit/config/options.hpp>
#include <conduit/dispatch/dispatch_table.hpp>
#include <conduit/execution/engine.hpp>
#include <conduit/facets/cross_chain_mint.hpp>
#include <conduit/relay/local_router.hpp>
#include <conduit/rpc/server.hpp>
#include <conduit/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = conduit::config::parse_options(argc, argv, std::cout);
  if (!parsed) {
    return 0;
  }
  const auto& options = *parsed;

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "conduit", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));

  auto encoder = conduit::schema::encoding::scale_encoder_t{};
  auto storage =
      conduit::storage::make_storage<conduit::storage::rocksdb_storage_tag>(
          options.db_path);

  auto router = conduit::relay::local_router{encoder, options.fees,
                                             options.supported_chains};
  auto table = conduit::dispatch::dispatch_table{};
  conduit::facets::cross_chain_mint::register_functions(table);
  table.seal();

  auto engine = conduit::execution::engine{encoder,
                                           storage,
                                           router,
                                           table,
                                           options.chain_name,
                                           options.strict_crypto};
  if (!engine.initialized()) {
    auto provisioned = engine.initialize(options.genesis);
    if (provisioned.code != 0) {
      spdlog::critical("Provisioning failed: {} ({})", provisioned.log,
                       provisioned.info);
      spdlog::shutdown();
      return 1;
    }
  }

  spdlog::info("gRPC service listening on {}", options.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = conduit::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to bind {}", options.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    grpc_server->GetHealthCheckService()->SetServingStatus(true);
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
