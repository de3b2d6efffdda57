#pragma once

#include <provenance/crypto/signature_verifier.hpp>
#include <provenance/registry/admin_authority.hpp>
#include <provenance/registry/trust_registry.hpp>
#include <provenance/schema/admin_grant.hpp>
#include <provenance/schema/audit_result.hpp>
#include <provenance/schema/content_hash.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/ledger_event.hpp>
#include <provenance/schema/ledger_info.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/result.hpp>
#include <provenance/schema/submission.hpp>
#include <provenance/schema/submission_details.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace provenance::ledger {

inline constexpr std::string_view kLedgerCodespace{"provenance.ledger"};
inline constexpr size_t kMaxDataUriSize = 2048;
inline constexpr size_t kMaxMetadataSize = 16384;

using subscription_id_t = uint64_t;

/// Append-only record of signed, content-addressed submissions.
///
/// A single writer (`write_mutex_`) runs validation, the durable commit and
/// event delivery for one submission at a time. Readers take a shared lock
/// on the committed view and never observe a half-applied submission: the
/// record, its three index appends and the new state root are published in
/// one exclusive section after the storage batch lands.
class submission_ledger final {
 public:
  submission_ledger(
      provenance::schema::encoding::scale_encoder_t& encoder,
      provenance::storage::rocksdb_storage_t& storage,
      std::shared_ptr<provenance::registry::trust_registry> registry,
      provenance::registry::admin_authority& authority,
      provenance::schema::content_hash_algorithm content_hash =
          provenance::schema::content_hash_algorithm::sha256);

  provenance::schema::result<provenance::schema::submission_id_t> submit_data(
      const provenance::schema::device_id_t& device_id,
      const provenance::schema::hash32_t& data_hash,
      const provenance::schema::bytes_t& signature,
      const std::string& data_uri,
      const std::string& metadata);

  provenance::schema::result<provenance::schema::submission_t>
  verify_submission(const provenance::schema::hash32_t& data_hash) const;

  /// True iff the content hash of `data` equals `data_hash`.
  provenance::schema::result<bool> verify_data_integrity(
      const provenance::schema::hash32_t& data_hash,
      const provenance::schema::bytes_view_t& data) const;

  std::vector<provenance::schema::hash32_t> get_device_submissions(
      const provenance::schema::device_id_t& device_id) const;
  std::vector<provenance::schema::hash32_t> get_verifier_submissions(
      const provenance::schema::address_t& verifier_address) const;

  /// The stored record joined with the registry's current device and
  /// verifier records.
  provenance::schema::result<provenance::schema::submission_details_t>
  get_submission_details(const provenance::schema::hash32_t& data_hash) const;

  bool has_submission(const provenance::schema::hash32_t& data_hash) const;
  uint64_t get_total_submissions() const;

  /// Hashes at sequence numbers [start, min(start + count, total)).
  provenance::schema::result<std::vector<provenance::schema::hash32_t>>
  get_submission_history(uint64_t start, uint64_t count) const;

  provenance::schema::result<provenance::schema::void_t> update_registry(
      const provenance::schema::admin_grant_t& grant,
      std::shared_ptr<provenance::registry::trust_registry> replacement);

  /// Sinks run on the writing thread while the writer lock is held. A sink
  /// may read the ledger but must not submit, update the registry, audit or
  /// replace the clock or verifier. Exceptions from a sink are logged.
  subscription_id_t subscribe(provenance::schema::event_sink_t sink);
  bool unsubscribe(subscription_id_t id);

  provenance::schema::ledger_info_t info() const;

  /// Re-fold the persisted submission log and compare with the live root.
  provenance::schema::audit_result_t audit_state_root() const;

  /// Registry currently consulted for submitter authorization.
  std::shared_ptr<provenance::registry::trust_registry> registry() const;

  void set_clock(provenance::schema::clock_source_t clock);
  void set_signature_verifier(provenance::crypto::signature_verifier_t verifier);

 private:
  void emit(const provenance::schema::ledger_event_t& event);
  void load_persisted_state();

  mutable std::mutex write_mutex_;
  mutable std::shared_mutex state_mutex_;
  mutable std::mutex registry_mutex_;
  mutable std::mutex subscriber_mutex_;

  provenance::schema::encoding::scale_encoder_t& encoder_;
  provenance::storage::rocksdb_storage_t& storage_;
  std::shared_ptr<provenance::registry::trust_registry> registry_;
  provenance::registry::admin_authority& authority_;
  provenance::schema::content_hash_algorithm content_hash_;
  provenance::schema::clock_source_t clock_;
  provenance::crypto::signature_verifier_t signature_verifier_;

  std::map<provenance::schema::hash32_t, provenance::schema::submission_t>
      submissions_;
  std::vector<provenance::schema::hash32_t> history_;
  std::map<provenance::schema::device_id_t,
           std::vector<provenance::schema::hash32_t>>
      device_submissions_;
  std::map<provenance::schema::address_t,
           std::vector<provenance::schema::hash32_t>>
      verifier_submissions_;
  provenance::schema::hash32_t state_root_{};

  subscription_id_t next_subscription_id_{1};
  std::map<subscription_id_t, provenance::schema::event_sink_t> subscribers_;
};

/// Next state root after appending `submission` to a log whose root is
/// `previous`.
provenance::schema::hash32_t fold_state_root(
    provenance::schema::encoding::scale_encoder_t& encoder,
    const provenance::schema::hash32_t& previous,
    const provenance::schema::submission_t& submission);

}  // namespace provenance::ledger
