#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <paulette/execution/engine.hpp>
#include <paulette/rpc/auction_client.hpp>
#include <paulette/rpc/server.hpp>
#include <paulette/rpc/token_client.hpp>
#include <paulette/storage/rocksdb/storage.hpp>
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

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto contract_id_hex = std::string{};
  auto auction_endpoint = std::string{};
  auto token_endpoint = std::string{};
  auto log_file = std::string{};
  auto strict_crypto = true;

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Paulette office ledger"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      boost::program_options::value<std::string>(&grpc_port)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the OfficeLedger service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "paulette.db"),
      "RocksDB directory holding ledger state")(
      "contract-id,c",
      boost::program_options::value<std::string>(&contract_id_hex)->required(),
      "32-byte contract identity as hex")(
      "auction-endpoint,a",
      boost::program_options::value<std::string>(&auction_endpoint)
          ->default_value("127.0.0.1:26660"),
      "IP:Port of the DutchAuction service")(
      "token-endpoint,t",
      boost::program_options::value<std::string>(&token_endpoint)
          ->default_value("127.0.0.1:26661"),
      "IP:Port of the Token service")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "paulette.log"),
      "Log file path")(
      "strict-crypto",
      boost::program_options::value<bool>(&strict_crypto)->default_value(true),
      "Verify admin signatures")("verbose,v", "Enable debug logging");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "paulette", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto contract_id = paulette::schema::try_make_hash32(contract_id_hex);
  if (!contract_id) {
    spdlog::error("--contract-id must be 32 bytes of hex, got '{}'",
                  contract_id_hex);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = paulette::schema::encoding::encoder<
      paulette::schema::encoding::scale_encoder_tag>{};
  auto storage =
      paulette::storage::make_storage<paulette::storage::rocksdb_storage_tag>(
          db_path);
  auto auction = paulette::rpc::auction_client{grpc::CreateChannel(
      auction_endpoint, grpc::InsecureChannelCredentials())};
  auto token = paulette::rpc::token_client{
      grpc::CreateChannel(token_endpoint, grpc::InsecureChannelCredentials())};
  auto clock = paulette::execution::system_time_source{};
  auto engine = paulette::execution::engine{
      encoder, storage, auction, token, clock,
      paulette::execution::engine_options{.contract_id = *contract_id,
                                          .strict_crypto = strict_crypto,
                                          .invoker_authenticated = false}};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = paulette::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_port);
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("OfficeLedger listening on {} (auction {}, token {})",
               grpc_port, auction_endpoint, token_endpoint);
  grpc_server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
