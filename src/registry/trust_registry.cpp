#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <provenance/crypto/verify.hpp>
#include <provenance/registry/trust_registry.hpp>
#include <provenance/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

using namespace provenance::schema;

namespace {

using entries_t = std::vector<provenance::storage::key_value_entry_t>;

// Verifier-device rows are prefix || address || big-endian position.
std::optional<address_t> address_from_verifier_device_key(
    const bytes_t& key) {
  auto offset = provenance::schema::key::kVerifierDeviceKeyPrefix.size();
  if (key.size() != offset + 32 + sizeof(uint64_t)) {
    return std::nullopt;
  }
  return try_make_hash32(bytes_view_t{key.data() + offset, 32});
}

template <typename T>
result<T> rejected(const error_code code, std::string log) {
  spdlog::warn("Registry rejected request ({}): {}", to_string(code), log);
  return failure<T>(code, provenance::registry::kRegistryCodespace,
                    std::move(log));
}

}  // namespace

namespace provenance::registry {

trust_registry::trust_registry(encoding::scale_encoder_t& encoder,
                               provenance::storage::rocksdb_storage_t& storage,
                               admin_authority& authority,
                               const hash32_t& registry_id)
    : encoder_{encoder},
      storage_{storage},
      authority_{authority},
      id_{registry_id},
      clock_{system_clock_milliseconds} {
  auto lock = std::scoped_lock{mutex_};
  load_persisted_state();
  spdlog::info("Trust registry {} ready with {} verifier(s), {} device(s)",
               to_hex(id_), verifiers_.size(), devices_.size());
}

result<verifier_t> trust_registry::register_verifier(
    const admin_grant_t& grant,
    const address_t& address,
    const std::string& name,
    const std::string& metadata) {
  if (is_zero(address)) {
    return rejected<verifier_t>(error_code::zero_address,
                                "verifier address must be non-zero");
  }
  if (name.empty() || name.size() > kMaxVerifierNameSize) {
    return rejected<verifier_t>(
        error_code::invalid_verifier_name,
        fmt::format("verifier name must be 1..{} bytes",
                    kMaxVerifierNameSize));
  }

  auto lock = std::scoped_lock{mutex_};
  if (verifiers_.contains(address)) {
    return rejected<verifier_t>(
        error_code::verifier_exists,
        fmt::format("verifier {} already registered", to_hex(address)));
  }
  auto authorized = authority_.authorize(
      admin_operation::register_verifier,
      make_bytes_view(make_register_verifier_subject(address, name, metadata)),
      grant);
  if (!authorized.ok()) {
    return forward_failure<verifier_t>(authorized);
  }

  auto verifier = verifier_t{};
  verifier.address = address;
  verifier.name = name;
  verifier.metadata = metadata;
  verifier.active = true;
  verifier.registered_at = clock_();

  storage_.commit_batch(entries_t{
      provenance::storage::make_entry(encoder_, key::make_verifier_key(address),
                                      verifier),
      std::move(*authorized.value)});
  verifiers_.emplace(address, verifier);
  spdlog::info("Registered verifier {} ('{}')", to_hex(address), name);
  return success(std::move(verifier));
}

result<verifier_t> trust_registry::set_verifier_active(
    const admin_grant_t& grant,
    const address_t& address,
    const bool active) {
  if (is_zero(address)) {
    return rejected<verifier_t>(error_code::zero_address,
                                "verifier address must be non-zero");
  }

  auto lock = std::scoped_lock{mutex_};
  auto it = verifiers_.find(address);
  if (it == std::end(verifiers_)) {
    return rejected<verifier_t>(
        error_code::verifier_missing,
        fmt::format("verifier {} not registered", to_hex(address)));
  }
  auto authorized = authority_.authorize(
      admin_operation::set_verifier_active,
      make_bytes_view(make_set_verifier_active_subject(address, active)),
      grant);
  if (!authorized.ok()) {
    return forward_failure<verifier_t>(authorized);
  }

  auto updated = it->second;
  updated.active = active;
  storage_.commit_batch(entries_t{
      provenance::storage::make_entry(encoder_, key::make_verifier_key(address),
                                      updated),
      std::move(*authorized.value)});
  it->second = updated;
  spdlog::info("Verifier {} is now {}", to_hex(address),
               active ? "active" : "inactive");
  return success(std::move(updated));
}

result<device_t> trust_registry::register_device(
    const admin_grant_t& grant,
    const device_id_t& device_id,
    const address_t& verifier_address,
    const bytes_t& public_key,
    const std::string& metadata) {
  if (is_zero(device_id)) {
    return rejected<device_t>(error_code::zero_device_id,
                              "device id must be non-zero");
  }
  if (is_zero(verifier_address)) {
    return rejected<device_t>(error_code::zero_address,
                              "verifier address must be non-zero");
  }
  if (!provenance::crypto::try_make_signer(make_bytes_view(public_key))) {
    return rejected<device_t>(
        error_code::unsupported_public_key,
        fmt::format("unsupported {}-byte device public key",
                    public_key.size()));
  }

  auto lock = std::scoped_lock{mutex_};
  if (devices_.contains(device_id)) {
    return rejected<device_t>(
        error_code::device_exists,
        fmt::format("device {} already registered", to_hex(device_id)));
  }
  auto verifier = verifiers_.find(verifier_address);
  if (verifier == std::end(verifiers_)) {
    return rejected<device_t>(
        error_code::verifier_missing,
        fmt::format("verifier {} not registered", to_hex(verifier_address)));
  }
  if (!verifier->second.active) {
    return rejected<device_t>(
        error_code::verifier_inactive,
        fmt::format("verifier {} is inactive", to_hex(verifier_address)));
  }
  auto authorized = authority_.authorize(
      admin_operation::register_device,
      make_bytes_view(make_register_device_subject(device_id, verifier_address,
                                                   public_key, metadata)),
      grant);
  if (!authorized.ok()) {
    return forward_failure<device_t>(authorized);
  }

  auto device = device_t{};
  device.device_id = device_id;
  device.verifier_address = verifier_address;
  device.public_key = public_key;
  device.metadata = metadata;
  device.active = true;
  device.registered_at = clock_();

  auto& owned = verifier_devices_[verifier_address];
  storage_.commit_batch(entries_t{
      provenance::storage::make_entry(encoder_, key::make_device_key(device_id),
                                      device),
      provenance::storage::make_entry(
          encoder_,
          key::make_verifier_device_key(verifier_address, owned.size()),
          device_id),
      std::move(*authorized.value)});
  devices_.emplace(device_id, device);
  owned.push_back(device_id);
  spdlog::info("Registered device {} under verifier {}", to_hex(device_id),
               to_hex(verifier_address));
  return success(std::move(device));
}

result<device_t> trust_registry::set_device_active(const admin_grant_t& grant,
                                                   const device_id_t& device_id,
                                                   const bool active) {
  if (is_zero(device_id)) {
    return rejected<device_t>(error_code::zero_device_id,
                              "device id must be non-zero");
  }

  auto lock = std::scoped_lock{mutex_};
  auto it = devices_.find(device_id);
  if (it == std::end(devices_)) {
    return rejected<device_t>(
        error_code::device_missing,
        fmt::format("device {} not registered", to_hex(device_id)));
  }
  auto authorized = authority_.authorize(
      admin_operation::set_device_active,
      make_bytes_view(make_set_device_active_subject(device_id, active)),
      grant);
  if (!authorized.ok()) {
    return forward_failure<device_t>(authorized);
  }

  auto updated = it->second;
  updated.active = active;
  storage_.commit_batch(entries_t{
      provenance::storage::make_entry(encoder_, key::make_device_key(device_id),
                                      updated),
      std::move(*authorized.value)});
  it->second = updated;
  spdlog::info("Device {} is now {}", to_hex(device_id),
               active ? "active" : "inactive");
  return success(std::move(updated));
}

bool trust_registry::is_verifier_active(const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = verifiers_.find(address);
  return it != std::end(verifiers_) && it->second.active;
}

bool trust_registry::is_device_active(const device_id_t& device_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = devices_.find(device_id);
  return it != std::end(devices_) && it->second.active;
}

result<device_t> trust_registry::get_device(
    const device_id_t& device_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = devices_.find(device_id);
  if (it == std::end(devices_)) {
    return failure<device_t>(
        error_code::device_missing, kRegistryCodespace,
        fmt::format("device {} not registered", to_hex(device_id)));
  }
  return success(it->second);
}

result<verifier_t> trust_registry::get_verifier(
    const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = verifiers_.find(address);
  if (it == std::end(verifiers_)) {
    return failure<verifier_t>(
        error_code::verifier_missing, kRegistryCodespace,
        fmt::format("verifier {} not registered", to_hex(address)));
  }
  return success(it->second);
}

result<bytes_t> trust_registry::get_device_public_key(
    const device_id_t& device_id) const {
  auto device = get_device(device_id);
  if (!device.ok()) {
    return forward_failure<bytes_t>(device);
  }
  return success(device.value->public_key);
}

result<std::vector<device_id_t>> trust_registry::get_verifier_devices(
    const address_t& address) const {
  auto lock = std::scoped_lock{mutex_};
  if (!verifiers_.contains(address)) {
    return failure<std::vector<device_id_t>>(
        error_code::verifier_missing, kRegistryCodespace,
        fmt::format("verifier {} not registered", to_hex(address)));
  }
  auto it = verifier_devices_.find(address);
  if (it == std::end(verifier_devices_)) {
    return success(std::vector<device_id_t>{});
  }
  return success(it->second);
}

std::optional<submitter> trust_registry::resolve_submitter(
    const device_id_t& device_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto device = devices_.find(device_id);
  if (device == std::end(devices_)) {
    return std::nullopt;
  }
  auto out = submitter{};
  out.device = device->second;
  auto verifier = verifiers_.find(device->second.verifier_address);
  if (verifier != std::end(verifiers_)) {
    out.verifier = verifier->second;
  }
  return out;
}

size_t trust_registry::verifier_count() const {
  auto lock = std::scoped_lock{mutex_};
  return verifiers_.size();
}

size_t trust_registry::device_count() const {
  auto lock = std::scoped_lock{mutex_};
  return devices_.size();
}

void trust_registry::set_clock(clock_source_t clock) {
  auto lock = std::scoped_lock{mutex_};
  clock_ = std::move(clock);
}

void trust_registry::load_persisted_state() {
  spdlog::debug("Loading persisted registry state");
  for (const auto& [k, value] : storage_.list_by_prefix(make_bytes_view(
           key::make_prefix_key(key::kVerifierKeyPrefix)))) {
    auto verifier = encoder_.decode<verifier_t>(make_bytes_view(value));
    verifiers_.emplace(verifier.address, std::move(verifier));
  }
  for (const auto& [k, value] : storage_.list_by_prefix(
           make_bytes_view(key::make_prefix_key(key::kDeviceKeyPrefix)))) {
    auto device = encoder_.decode<device_t>(make_bytes_view(value));
    devices_.emplace(device.device_id, std::move(device));
  }
  for (const auto& [k, value] : storage_.list_by_prefix(make_bytes_view(
           key::make_prefix_key(key::kVerifierDeviceKeyPrefix)))) {
    auto address = address_from_verifier_device_key(k);
    if (!address) {
      provenance::common::critical("malformed verifier device key");
    }
    auto device_id = encoder_.decode<device_id_t>(make_bytes_view(value));
    if (!devices_.contains(device_id)) {
      provenance::common::critical("verifier device row names unknown device");
    }
    verifier_devices_[*address].push_back(device_id);
  }
}

}  // namespace provenance::registry
