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
#include <iostream>
#include <rndr/config/options.hpp>
#include <rndr/execution/engine.hpp>
#include <rndr/service/server.hpp>
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
  auto parsed = rndr::config::parse_node_options(argc, argv);
  if (parsed.help_requested) {
    std::cout << parsed.messages.front() << std::endl;
    return 0;
  }
  if (!parsed.options) {
    for (const auto& message : parsed.messages) {
      std::cerr << "rndr_node: " << message << std::endl;
    }
    return 1;
  }
  auto& options = *parsed.options;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "rndr", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.log_level);

  spdlog::info("Opening ledger database at '{}'", options.db_path);
  auto encoder = rndr::execution::encoder_t{};
  auto storage =
      rndr::storage::make_storage<rndr::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = rndr::execution::engine{encoder, storage, options.genesis,
                                        options.strict_crypto};
  if (!options.strict_crypto) {
    spdlog::warn("Strict crypto is disabled; signatures are not verified");
  }

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = rndr::service::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC service on {}",
                     options.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("gRPC service listening on {}", options.grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
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
