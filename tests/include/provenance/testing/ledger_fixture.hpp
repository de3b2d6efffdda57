#pragma once

#include <provenance/crypto/digest.hpp>
#include <provenance/crypto/key_pair.hpp>
#include <provenance/crypto/verify.hpp>
#include <provenance/ledger/submission_ledger.hpp>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/registry/trust_registry.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace provenance::testing {

using scale_encoder_t = provenance::schema::encoding::scale_encoder_t;

inline const auto kRegistryId = make_hash(0xA0);

/// Admin grant for `operation` on `subject`, signed by `admin` for the next
/// nonce `authority` expects.
inline provenance::schema::admin_grant_t make_grant(
    const provenance::crypto::key_pair& admin,
    const provenance::registry::admin_authority& authority,
    const provenance::schema::admin_operation operation,
    const provenance::schema::bytes_t& subject) {
  auto grant = provenance::schema::admin_grant_t{};
  grant.nonce = authority.next_nonce();
  auto challenge = provenance::registry::make_admin_challenge(
      operation, provenance::schema::make_bytes_view(subject), grant.nonce);
  grant.signature =
      admin.sign(provenance::schema::make_bytes_view(challenge)).value();
  return grant;
}

inline provenance::schema::bytes_t sign_hash(
    const provenance::crypto::key_pair& key,
    const provenance::schema::hash32_t& data_hash) {
  return key.sign(provenance::schema::make_bytes_view(data_hash)).value();
}

inline provenance::schema::hash32_t hash_payload(
    const std::string_view payload,
    const provenance::schema::content_hash_algorithm algorithm =
        provenance::schema::content_hash_algorithm::sha256) {
  return provenance::crypto::content_hash(
      algorithm, provenance::schema::make_bytes_view(payload));
}

/// Storage, admin authority, registry and ledger opened over one database.
struct ledger_stack final {
  ledger_stack(const std::string& path,
               scale_encoder_t& encoder,
               const provenance::schema::signer_id_t& administrator,
               const provenance::schema::content_hash_algorithm content_hash)
      : storage{provenance::storage::make_storage<
            provenance::storage::rocksdb_storage_tag>(path)},
        authority{encoder, storage, administrator},
        registry{std::make_shared<provenance::registry::trust_registry>(
            encoder, storage, authority, kRegistryId)},
        ledger{encoder, storage, registry, authority, content_hash} {}

  provenance::storage::rocksdb_storage_t storage;
  provenance::registry::admin_authority authority;
  std::shared_ptr<provenance::registry::trust_registry> registry;
  provenance::ledger::submission_ledger ledger;
};

class ledger_fixture final {
 public:
  explicit ledger_fixture(
      const std::string_view db_prefix,
      const provenance::schema::signature_scheme admin_scheme =
          provenance::schema::signature_scheme::ed25519,
      const provenance::schema::content_hash_algorithm content_hash =
          provenance::schema::content_hash_algorithm::sha256)
      : db_path_{make_db_path(db_prefix)},
        content_hash_{content_hash},
        admin_{provenance::crypto::key_pair::generate(admin_scheme).value()},
        administrator_{provenance::crypto::try_make_signer(
                           provenance::schema::make_bytes_view(
                               admin_.public_key()))
                           .value()} {
    open();
  }

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    stack_.reset();
    remove_path(db_path_);
  }

  /// Close everything and open it again from the same database.
  void reopen() {
    stack_.reset();
    open();
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  const provenance::crypto::key_pair& admin() const { return admin_; }

  provenance::storage::rocksdb_storage_t& storage() { return stack_->storage; }
  provenance::registry::admin_authority& authority() {
    return stack_->authority;
  }
  provenance::registry::trust_registry& registry() {
    return *stack_->registry;
  }
  std::shared_ptr<provenance::registry::trust_registry> registry_ptr() {
    return stack_->registry;
  }
  provenance::ledger::submission_ledger& ledger() { return stack_->ledger; }

  provenance::schema::admin_grant_t grant(
      const provenance::schema::admin_operation operation,
      const provenance::schema::bytes_t& subject) {
    return make_grant(admin_, authority(), operation, subject);
  }

  provenance::schema::result<provenance::schema::verifier_t> register_verifier(
      const provenance::schema::address_t& address,
      const std::string& name = "verifier",
      const std::string& metadata = {}) {
    return registry().register_verifier(
        grant(provenance::schema::admin_operation::register_verifier,
              provenance::registry::make_register_verifier_subject(
                  address, name, metadata)),
        address, name, metadata);
  }

  provenance::schema::result<provenance::schema::verifier_t>
  set_verifier_active(const provenance::schema::address_t& address,
                      const bool active) {
    return registry().set_verifier_active(
        grant(provenance::schema::admin_operation::set_verifier_active,
              provenance::registry::make_set_verifier_active_subject(address,
                                                                     active)),
        address, active);
  }

  provenance::schema::result<provenance::schema::device_t> register_device(
      const provenance::schema::device_id_t& device_id,
      const provenance::schema::address_t& verifier_address,
      const provenance::schema::bytes_t& public_key,
      const std::string& metadata = {}) {
    return registry().register_device(
        grant(provenance::schema::admin_operation::register_device,
              provenance::registry::make_register_device_subject(
                  device_id, verifier_address, public_key, metadata)),
        device_id, verifier_address, public_key, metadata);
  }

  provenance::schema::result<provenance::schema::device_t> set_device_active(
      const provenance::schema::device_id_t& device_id,
      const bool active) {
    return registry().set_device_active(
        grant(provenance::schema::admin_operation::set_device_active,
              provenance::registry::make_set_device_active_subject(device_id,
                                                                   active)),
        device_id, active);
  }

  /// Submit `payload` hashed with the ledger's algorithm and signed by `key`.
  provenance::schema::result<provenance::schema::submission_id_t> submit(
      const provenance::schema::device_id_t& device_id,
      const provenance::crypto::key_pair& key,
      const std::string_view payload,
      const std::string& data_uri = "ipfs://payload",
      const std::string& metadata = "{}") {
    auto data_hash = hash_payload(payload, content_hash_);
    return ledger().submit_data(device_id, data_hash, sign_hash(key, data_hash),
                                data_uri, metadata);
  }

 private:
  void open() {
    stack_ = std::make_unique<ledger_stack>(db_path_, encoder_, administrator_,
                                            content_hash_);
  }

  std::string db_path_;
  provenance::schema::content_hash_algorithm content_hash_;
  scale_encoder_t encoder_;
  provenance::crypto::key_pair admin_;
  provenance::schema::signer_id_t administrator_;
  std::unique_ptr<ledger_stack> stack_;
};

}  // namespace provenance::testing
