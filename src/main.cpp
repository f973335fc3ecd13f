#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <clearhouse/config/settings.hpp>
#include <clearhouse/execution/engine.hpp>
#include <clearhouse/intake/dedup_store.hpp>
#include <clearhouse/ledger/batch_store.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/ledger/memory_log.hpp>
#include <clearhouse/ledger/rocksdb_batch_store.hpp>
#include <clearhouse/ledger/rocksdb_log.hpp>
#include <clearhouse/rpc/server.hpp>
#include <clearhouse/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
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

  auto parsed = std::optional<clearhouse::config::settings>{};
  try {
    parsed = clearhouse::config::parse_settings(argc, argv, std::cout);
  } catch (const boost::program_options::error& e) {
    std::cerr << "invalid options: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    return 1;
  }
  if (!parsed) {
    return 0;
  }
  auto& settings = *parsed;

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      settings.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "clearhouse", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(settings.log_level));

  auto storage = std::optional<
      clearhouse::storage::storage<clearhouse::storage::rocksdb_storage_tag>>{};
  auto log = std::unique_ptr<clearhouse::ledger::durable_log>{};
  auto batches = std::unique_ptr<clearhouse::ledger::batch_store>{};
  if (settings.db_path.empty()) {
    spdlog::warn("no --db-path given, events and batches stay in memory");
    log = std::make_unique<clearhouse::ledger::memory_log>();
    batches = std::make_unique<clearhouse::ledger::memory_batch_store>();
  } else {
    storage = clearhouse::storage::make_storage<
        clearhouse::storage::rocksdb_storage_tag>(settings.db_path);
    log = std::make_unique<clearhouse::ledger::rocksdb_log>(*storage);
    batches =
        std::make_unique<clearhouse::ledger::rocksdb_batch_store>(*storage);
  }

  auto dedup = clearhouse::intake::dedup_store{settings.dedup_retention};
  auto emitter = clearhouse::ledger::emitter{*log};
  auto engine = clearhouse::execution::engine{
      settings.engine, settings.pricing, settings.limits,
      dedup,           emitter,          *batches};

  spdlog::info("gRPC service listening on {}", settings.listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = clearhouse::rpc::listener{engine, emitter};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(settings.listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("failed to start gRPC server on {}", settings.listen);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::jthread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto period = std::chrono::milliseconds{settings.tick};
    while (!shutdown_requested()) {
      engine.tick(clearhouse::rpc::system_now());
      std::this_thread::sleep_for(period);
    }
    spdlog::info("shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
    engine.cancel();
    engine.flush(clearhouse::rpc::system_now());
    auto parked = emitter.flush_pending();
    if (parked > 0) {
      spdlog::error("{} events could not be delivered before shutdown",
                    parked);
    }
  });

  threads.clear();

  spdlog::shutdown();
  return 0;
}
