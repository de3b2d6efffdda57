#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <provenance/blake3/hash.hpp>
#include <provenance/crypto/verify.hpp>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/schema/key/ledger_keys.hpp>

using namespace provenance::schema;

namespace provenance::registry {

bytes_t make_register_verifier_subject(const address_t& address,
                                       const std::string& name,
                                       const std::string& metadata) {
  return make_admin_subject(address, name, metadata);
}

bytes_t make_set_verifier_active_subject(const address_t& address,
                                         const bool active) {
  return make_admin_subject(address, active);
}

bytes_t make_register_device_subject(const device_id_t& device_id,
                                     const address_t& verifier_address,
                                     const bytes_t& public_key,
                                     const std::string& metadata) {
  return make_admin_subject(device_id, verifier_address, public_key, metadata);
}

bytes_t make_set_device_active_subject(const device_id_t& device_id,
                                       const bool active) {
  return make_admin_subject(device_id, active);
}

bytes_t make_update_registry_subject(const hash32_t& registry_id) {
  return make_admin_subject(registry_id);
}

hash32_t make_admin_challenge(const admin_operation operation,
                              const bytes_view_t& subject,
                              const uint64_t nonce) {
  auto encoder = encoding::scale_encoder_t{};
  auto material = encoder.encode(std::tuple{
      std::string{kAdminChallengeDomain}, operation, make_bytes(subject),
      nonce});
  return provenance::blake3::hash(make_bytes_view(material));
}

admin_authority::admin_authority(encoding::scale_encoder_t& encoder,
                                 provenance::storage::rocksdb_storage_t& storage,
                                 signer_id_t administrator)
    : encoder_{encoder},
      storage_{storage},
      administrator_{std::move(administrator)},
      signature_verifier_{[](const bytes_view_t& message,
                             const signer_id_t& signer,
                             const signature_t& signature) {
        return provenance::crypto::verify_signature(message, signer,
                                                    signature);
      }} {
  auto key = key::make_prefix_key(key::kAdminNonceKey);
  auto persisted = storage_.get<uint64_t>(encoder_, make_bytes_view(key));
  if (persisted) {
    next_nonce_ = *persisted;
  }
  spdlog::info("Admin authority ready; next grant nonce {}", next_nonce_);
}

result<provenance::storage::key_value_entry_t> admin_authority::authorize(const admin_operation operation,
                                          const bytes_view_t& subject,
                                          const admin_grant_t& grant) {
  auto lock = std::scoped_lock{mutex_};
  if (grant.nonce != next_nonce_) {
    spdlog::warn("Rejected {} grant: nonce {} != expected {}",
                 to_string(operation), grant.nonce, next_nonce_);
    return failure<provenance::storage::key_value_entry_t>(
        error_code::admin_nonce_mismatch, kAdminCodespace,
        fmt::format("expected admin nonce {}, got {}", next_nonce_,
                    grant.nonce));
  }

  auto challenge = make_admin_challenge(operation, subject, grant.nonce);
  auto signature = provenance::crypto::try_make_signature(
      administrator_, make_bytes_view(grant.signature));
  if (!signature ||
      !signature_verifier_(make_bytes_view(challenge), administrator_,
                           *signature)) {
    spdlog::warn("Rejected {} grant: bad administrator signature",
                 to_string(operation));
    return failure<provenance::storage::key_value_entry_t>(
        error_code::admin_signature_invalid, kAdminCodespace,
        "admin grant signature does not verify");
  }

  ++next_nonce_;
  spdlog::debug("Accepted {} grant with nonce {}", to_string(operation),
                grant.nonce);
  return success(provenance::storage::make_entry(
      encoder_, key::make_prefix_key(key::kAdminNonceKey), next_nonce_));
}

uint64_t admin_authority::next_nonce() const {
  auto lock = std::scoped_lock{mutex_};
  return next_nonce_;
}

void admin_authority::set_signature_verifier(
    provenance::crypto::signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

}  // namespace provenance::registry
