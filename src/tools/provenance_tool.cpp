#include <boost/program_options.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/crypto/digest.hpp>
#include <provenance/crypto/key_pair.hpp>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/schema/admin_operation.hpp>
#include <provenance/schema/content_hash.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/signature_scheme.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;
using namespace provenance::schema;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    provenance::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

bytes_t require_hex(const po::variables_map& vm, const std::string& name) {
  auto decoded = try_from_hex(require(vm, name));
  if (!decoded) {
    provenance::common::critical("--" + name + " must be hex");
  }
  return *decoded;
}

hash32_t require_hash32(const po::variables_map& vm, const std::string& name) {
  auto hash = try_make_hash32(std::string_view{require(vm, name)});
  if (!hash) {
    provenance::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

template <typename Enum>
Enum require_enum(const po::variables_map& vm, const std::string& name) {
  auto value = try_from_string<Enum>(require(vm, name));
  if (!value) {
    provenance::common::critical("unsupported --" + name + " value");
  }
  return *value;
}

provenance::crypto::key_pair load_key(const po::variables_map& vm) {
  auto key = provenance::crypto::key_pair::from_private_key(
      require_enum<signature_scheme>(vm, "scheme"),
      make_bytes_view(require_hex(vm, "private-key")));
  if (!key) {
    provenance::common::critical("--private-key is not a valid private key");
  }
  return *key;
}

bytes_t read_payload(const po::variables_map& vm) {
  if (vm.contains("data")) {
    return make_bytes(vm["data"].as<std::string>());
  }
  auto path = require(vm, "file");
  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    provenance::common::critical("cannot open --file " + path);
  }
  return bytes_t{std::istreambuf_iterator<char>{input},
                 std::istreambuf_iterator<char>{}};
}

bytes_t build_admin_subject(const po::variables_map& vm) {
  switch (require_enum<admin_operation>(vm, "operation")) {
    case admin_operation::register_verifier:
      return provenance::registry::make_register_verifier_subject(
          require_hash32(vm, "address"), require(vm, "name"),
          vm["metadata"].as<std::string>());
    case admin_operation::set_verifier_active:
      return provenance::registry::make_set_verifier_active_subject(
          require_hash32(vm, "address"), vm["active"].as<bool>());
    case admin_operation::register_device:
      return provenance::registry::make_register_device_subject(
          require_hash32(vm, "device-id"),
          require_hash32(vm, "verifier-address"),
          require_hex(vm, "public-key"), vm["metadata"].as<std::string>());
    case admin_operation::set_device_active:
      return provenance::registry::make_set_device_active_subject(
          require_hash32(vm, "device-id"), vm["active"].as<bool>());
    case admin_operation::update_registry:
      return provenance::registry::make_update_registry_subject(
          require_hash32(vm, "registry-id"));
  }
  provenance::common::critical("unsupported admin operation");
}

hash32_t build_admin_challenge(const po::variables_map& vm) {
  return provenance::registry::make_admin_challenge(
      require_enum<admin_operation>(vm, "operation"),
      make_bytes_view(require_hex(vm, "subject")), vm["nonce"].as<uint64_t>());
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  provenance_tool keygen --scheme S\n"
            << "  provenance_tool public-key --scheme S --private-key HEX\n"
            << "  provenance_tool hash (--file F | --data STR) "
               "[--algorithm sha256|blake3]\n"
            << "  provenance_tool sign --scheme S --private-key HEX "
               "--data-hash HEX\n"
            << "  provenance_tool admin-subject --operation OP [arguments]\n"
            << "  provenance_tool admin-challenge --operation OP --subject HEX "
               "--nonce N\n"
            << "  provenance_tool sign-admin --scheme S --private-key HEX "
               "--operation OP --subject HEX --nonce N\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"provenance_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|public-key|hash|sign|admin-subject|admin-challenge|sign-admin")(
      "scheme", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("private-key", po::value<std::string>(),
                           "32-byte private key hex")(
      "file", po::value<std::string>(), "payload file")(
      "data", po::value<std::string>(), "inline payload")(
      "algorithm", po::value<std::string>()->default_value("sha256"),
      "sha256|blake3")("data-hash", po::value<std::string>(),
                       "32-byte content hash hex")(
      "operation", po::value<std::string>(),
      "register_verifier|set_verifier_active|register_device|"
      "set_device_active|update_registry")(
      "subject", po::value<std::string>(), "admin subject hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "admin grant nonce")(
      "address", po::value<std::string>(), "verifier address hex")(
      "name", po::value<std::string>(), "verifier name")(
      "metadata", po::value<std::string>()->default_value(""),
      "verifier or device metadata")("device-id", po::value<std::string>(),
                                     "device id hex")(
      "verifier-address", po::value<std::string>(),
      "owning verifier address hex")("public-key", po::value<std::string>(),
                                     "device public key hex")(
      "active", po::value<bool>()->default_value(true), "activity flag")(
      "registry-id", po::value<std::string>(), "registry id hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto key = provenance::crypto::key_pair::generate(
        require_enum<signature_scheme>(vm, "scheme"));
    if (!key) {
      provenance::common::critical("key generation failed");
    }
    std::cout << "private-key " << to_hex(make_bytes_view(key->private_key()))
              << '\n'
              << "public-key " << to_hex(make_bytes_view(key->public_key()))
              << '\n';
    return 0;
  }

  if (command == "public-key") {
    std::cout << to_hex(make_bytes_view(load_key(vm).public_key())) << '\n';
    return 0;
  }

  if (command == "hash") {
    auto payload = read_payload(vm);
    std::cout << to_hex(provenance::crypto::content_hash(
                     require_enum<content_hash_algorithm>(vm, "algorithm"),
                     make_bytes_view(payload)))
              << '\n';
    return 0;
  }

  if (command == "sign") {
    auto data_hash = require_hash32(vm, "data-hash");
    auto signature = load_key(vm).sign(make_bytes_view(data_hash));
    if (!signature) {
      provenance::common::critical("signing failed");
    }
    std::cout << to_hex(make_bytes_view(*signature)) << '\n';
    return 0;
  }

  if (command == "admin-subject") {
    std::cout << to_hex(make_bytes_view(build_admin_subject(vm))) << '\n';
    return 0;
  }

  if (command == "admin-challenge") {
    std::cout << to_hex(build_admin_challenge(vm)) << '\n';
    return 0;
  }

  if (command == "sign-admin") {
    auto challenge = build_admin_challenge(vm);
    auto signature = load_key(vm).sign(make_bytes_view(challenge));
    if (!signature) {
      provenance::common::critical("signing failed");
    }
    std::cout << to_hex(make_bytes_view(*signature)) << '\n';
    return 0;
  }

  provenance::common::critical(
      "command must be keygen|public-key|hash|sign|admin-subject|"
      "admin-challenge|sign-admin");
}
