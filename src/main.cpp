#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <provenance/blake3/hash.hpp>
#include <provenance/crypto/verify.hpp>
#include <provenance/ledger/submission_ledger.hpp>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/registry/trust_registry.hpp>
#include <provenance/rpc/server.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

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

  auto config_path = std::string{};
  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto admin_public_key = std::string{};
  auto content_hash = std::string{};
  auto log_file = std::string{};

  auto description = po::options_description{"Provenance ledger"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with the options below")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26670"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("provenance.db"),
      "RocksDB directory")(
      "admin-public-key", po::value<std::string>(&admin_public_key),
      "administrator public key hex (32-byte Ed25519 or 33-byte secp256k1)")(
      "content-hash",
      po::value<std::string>(&content_hash)->default_value("sha256"),
      "content hash for integrity checks: sha256|blake3")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("provenance.log"),
      "log file path")("verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config = std::ifstream{vm["config"].as<std::string>()};
      if (!config.good()) {
        std::cerr << "cannot open config file '"
                  << vm["config"].as<std::string>() << "'" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (!provenance::crypto::available()) {
    spdlog::error("OpenSSL does not provide Ed25519 and secp256k1");
    spdlog::shutdown();
    return 1;
  }

  auto admin_key = provenance::schema::try_from_hex(admin_public_key);
  auto administrator =
      admin_key ? provenance::crypto::try_make_signer(
                      provenance::schema::make_bytes_view(*admin_key))
                : std::nullopt;
  if (!administrator) {
    spdlog::error("--admin-public-key must be a 32 or 33 byte public key hex");
    spdlog::shutdown();
    return 1;
  }

  auto algorithm =
      provenance::schema::try_from_string<
          provenance::schema::content_hash_algorithm>(content_hash);
  if (!algorithm) {
    spdlog::error("unknown --content-hash '{}'", content_hash);
    spdlog::shutdown();
    return 1;
  }

  auto encoder = provenance::schema::encoding::scale_encoder_t{};
  auto storage = provenance::storage::make_storage<
      provenance::storage::rocksdb_storage_tag>(db_path);
  auto authority = provenance::registry::admin_authority{encoder, storage,
                                                         *administrator};
  auto registry_id =
      provenance::blake3::hash(std::string{"provenance.registry|"} + db_path);
  auto registry = std::make_shared<provenance::registry::trust_registry>(
      encoder, storage, authority, registry_id);
  auto ledger = provenance::ledger::submission_ledger{
      encoder, storage, registry, authority, *algorithm};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = provenance::rpc::listener{ledger, authority};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down gRPC service");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
