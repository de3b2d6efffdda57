#pragma once

#include <provenance/registry/admin_authority.hpp>
#include <provenance/schema/admin_grant.hpp>
#include <provenance/schema/device.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/result.hpp>
#include <provenance/schema/verifier.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace provenance::registry {

inline constexpr std::string_view kRegistryCodespace{"provenance.registry"};
inline constexpr size_t kMaxVerifierNameSize = 100;

/// Device and owning verifier captured in one critical section.
struct submitter final {
  provenance::schema::device_t device;
  /// Empty only if the registry lost the verifier record.
  std::optional<provenance::schema::verifier_t> verifier;
};

/// Source of truth for which verifiers and devices may act.
///
/// Records are held in memory and written through to storage on every
/// accepted mutation. Verifiers and devices are never removed; only their
/// `active` flags change. Every mutation requires an admin grant, checked
/// after argument and state checks so that a rejected call consumes no
/// grant nonce.
class trust_registry final {
 public:
  trust_registry(provenance::schema::encoding::scale_encoder_t& encoder,
                 provenance::storage::rocksdb_storage_t& storage,
                 admin_authority& authority,
                 const provenance::schema::hash32_t& registry_id);

  provenance::schema::result<provenance::schema::verifier_t>
  register_verifier(const provenance::schema::admin_grant_t& grant,
                    const provenance::schema::address_t& address,
                    const std::string& name,
                    const std::string& metadata);

  provenance::schema::result<provenance::schema::verifier_t>
  set_verifier_active(const provenance::schema::admin_grant_t& grant,
                      const provenance::schema::address_t& address,
                      bool active);

  provenance::schema::result<provenance::schema::device_t> register_device(
      const provenance::schema::admin_grant_t& grant,
      const provenance::schema::device_id_t& device_id,
      const provenance::schema::address_t& verifier_address,
      const provenance::schema::bytes_t& public_key,
      const std::string& metadata);

  provenance::schema::result<provenance::schema::device_t> set_device_active(
      const provenance::schema::admin_grant_t& grant,
      const provenance::schema::device_id_t& device_id,
      bool active);

  bool is_verifier_active(const provenance::schema::address_t& address) const;
  bool is_device_active(const provenance::schema::device_id_t& device_id) const;

  provenance::schema::result<provenance::schema::device_t> get_device(
      const provenance::schema::device_id_t& device_id) const;
  provenance::schema::result<provenance::schema::verifier_t> get_verifier(
      const provenance::schema::address_t& address) const;
  provenance::schema::result<provenance::schema::bytes_t>
  get_device_public_key(const provenance::schema::device_id_t& device_id) const;
  provenance::schema::result<std::vector<provenance::schema::device_id_t>>
  get_verifier_devices(const provenance::schema::address_t& address) const;

  /// Device plus its verifier, or std::nullopt for an unknown device.
  std::optional<submitter> resolve_submitter(
      const provenance::schema::device_id_t& device_id) const;

  size_t verifier_count() const;
  size_t device_count() const;
  const provenance::schema::hash32_t& id() const { return id_; }

  void set_clock(provenance::schema::clock_source_t clock);

 private:
  void load_persisted_state();

  mutable std::mutex mutex_;
  provenance::schema::encoding::scale_encoder_t& encoder_;
  provenance::storage::rocksdb_storage_t& storage_;
  admin_authority& authority_;
  provenance::schema::hash32_t id_;
  provenance::schema::clock_source_t clock_;
  std::map<provenance::schema::address_t, provenance::schema::verifier_t>
      verifiers_;
  std::map<provenance::schema::device_id_t, provenance::schema::device_t>
      devices_;
  std::map<provenance::schema::address_t,
           std::vector<provenance::schema::device_id_t>>
      verifier_devices_;
};

}  // namespace provenance::registry
