#pragma once

#include <provenance/crypto/signature_verifier.hpp>
#include <provenance/schema/admin_grant.hpp>
#include <provenance/schema/admin_operation.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/result.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

namespace provenance::registry {

inline constexpr std::string_view kAdminCodespace{"provenance.admin"};
inline constexpr std::string_view kAdminChallengeDomain{"provenance.admin.v1"};

/// SCALE encoding of the arguments an admin grant is bound to.
template <typename... Args>
provenance::schema::bytes_t make_admin_subject(const Args&... args) {
  auto encoder = provenance::schema::encoding::scale_encoder_t{};
  return encoder.encode(std::tuple{args...});
}

provenance::schema::bytes_t make_register_verifier_subject(
    const provenance::schema::address_t& address,
    const std::string& name,
    const std::string& metadata);
provenance::schema::bytes_t make_set_verifier_active_subject(
    const provenance::schema::address_t& address,
    bool active);
provenance::schema::bytes_t make_register_device_subject(
    const provenance::schema::device_id_t& device_id,
    const provenance::schema::address_t& verifier_address,
    const provenance::schema::bytes_t& public_key,
    const std::string& metadata);
provenance::schema::bytes_t make_set_device_active_subject(
    const provenance::schema::device_id_t& device_id,
    bool active);
provenance::schema::bytes_t make_update_registry_subject(
    const provenance::schema::hash32_t& registry_id);

/// The 32-byte message an administrator signs to authorize `operation` on
/// `subject` with grant `nonce`.
provenance::schema::hash32_t make_admin_challenge(
    provenance::schema::admin_operation operation,
    const provenance::schema::bytes_view_t& subject,
    uint64_t nonce);

/// Gatekeeper for administrative mutations.
///
/// Grants are single-use and strictly ordered: the grant nonce must equal
/// the next expected nonce, which advances on every successful
/// authorization. The advanced nonce is handed back as a storage entry so the
/// caller persists it in the same batch as the mutation it authorized.
class admin_authority final {
 public:
  admin_authority(
      provenance::schema::encoding::scale_encoder_t& encoder,
      provenance::storage::rocksdb_storage_t& storage,
      provenance::schema::signer_id_t administrator);

  /// Check `grant` against `operation` and `subject` and consume its nonce.
  /// On success the value is the nonce row to include in the caller's
  /// `commit_batch`.
  provenance::schema::result<provenance::storage::key_value_entry_t> authorize(
      provenance::schema::admin_operation operation,
      const provenance::schema::bytes_view_t& subject,
      const provenance::schema::admin_grant_t& grant);

  uint64_t next_nonce() const;
  const provenance::schema::signer_id_t& administrator() const {
    return administrator_;
  }

  void set_signature_verifier(provenance::crypto::signature_verifier_t verifier);

 private:
  mutable std::mutex mutex_;
  provenance::schema::encoding::scale_encoder_t& encoder_;
  provenance::storage::rocksdb_storage_t& storage_;
  provenance::schema::signer_id_t administrator_;
  uint64_t next_nonce_{1};
  provenance::crypto::signature_verifier_t signature_verifier_;
};

}  // namespace provenance::registry
