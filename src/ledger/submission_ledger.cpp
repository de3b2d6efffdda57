#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <provenance/blake3/hash.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/crypto/digest.hpp>
#include <provenance/crypto/verify.hpp>
#include <provenance/ledger/submission_ledger.hpp>
#include <provenance/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>

using namespace provenance::schema;

namespace {

using entries_t = std::vector<provenance::storage::key_value_entry_t>;
using index_t = std::map<hash32_t, std::vector<hash32_t>>;

template <typename T>
result<T> rejected(const error_code code, std::string log) {
  spdlog::warn("Ledger rejected request ({}): {}", to_string(code), log);
  return failure<T>(code, provenance::ledger::kLedgerCodespace,
                    std::move(log));
}

// Index rows are prefix || 32-byte owner id || big-endian position and are
// listed in key order, so positions come back ascending per owner.
index_t load_index(provenance::schema::encoding::scale_encoder_t& encoder,
                   const provenance::storage::rocksdb_storage_t& storage,
                   const std::string_view prefix) {
  auto index = index_t{};
  for (const auto& [k, value] : storage.list_by_prefix(
           make_bytes_view(provenance::schema::key::make_prefix_key(prefix)))) {
    if (k.size() != prefix.size() + 32 + sizeof(uint64_t)) {
      provenance::common::critical("malformed ledger index key");
    }
    auto owner = make_hash32(bytes_t{k.data() + prefix.size(),
                                     k.data() + prefix.size() + 32});
    index[owner].push_back(encoder.decode<hash32_t>(make_bytes_view(value)));
  }
  return index;
}

// Persisted log in sequence order, read back from storage.
std::vector<submission_t> load_submission_log(
    provenance::schema::encoding::scale_encoder_t& encoder,
    const provenance::storage::rocksdb_storage_t& storage,
    std::string& error) {
  auto log = std::vector<submission_t>{};
  for (const auto& [k, value] :
       storage.list_by_prefix(make_bytes_view(
           provenance::schema::key::make_prefix_key(
               provenance::schema::key::kHistoryKeyPrefix)))) {
    auto data_hash = encoder.decode<hash32_t>(make_bytes_view(value));
    auto record = storage.get<submission_t>(
        encoder,
        make_bytes_view(provenance::schema::key::make_submission_key(data_hash)));
    if (!record) {
      error = fmt::format("submission {} at sequence {} is missing",
                          to_hex(data_hash), log.size());
      return log;
    }
    if (record->sequence_number != log.size() ||
        record->data_hash != data_hash) {
      error = fmt::format("history row {} does not match its submission",
                          log.size());
      return log;
    }
    log.push_back(std::move(*record));
  }
  return log;
}

}  // namespace

namespace provenance::ledger {

hash32_t fold_state_root(encoding::scale_encoder_t& encoder,
                         const hash32_t& previous,
                         const submission_t& submission) {
  auto material = bytes_t{std::begin(previous), std::end(previous)};
  encoder.encode(submission, material);
  return provenance::blake3::hash(make_bytes_view(material));
}

submission_ledger::submission_ledger(
    encoding::scale_encoder_t& encoder,
    provenance::storage::rocksdb_storage_t& storage,
    std::shared_ptr<provenance::registry::trust_registry> registry,
    provenance::registry::admin_authority& authority,
    const content_hash_algorithm content_hash)
    : encoder_{encoder},
      storage_{storage},
      registry_{std::move(registry)},
      authority_{authority},
      content_hash_{content_hash},
      clock_{system_clock_milliseconds},
      signature_verifier_{[](const bytes_view_t& message,
                             const signer_id_t& signer,
                             const signature_t& signature) {
        return provenance::crypto::verify_signature(message, signer,
                                                    signature);
      }} {
  if (!registry_) {
    provenance::common::critical("submission ledger requires a registry");
  }
  auto lock = std::scoped_lock{write_mutex_};
  load_persisted_state();
  spdlog::info("Submission ledger ready with {} submission(s), root {}",
               history_.size(), to_hex(state_root_));
}

result<submission_id_t> submission_ledger::submit_data(
    const device_id_t& device_id,
    const hash32_t& data_hash,
    const bytes_t& signature,
    const std::string& data_uri,
    const std::string& metadata) {
  if (is_zero(data_hash)) {
    return rejected<submission_id_t>(error_code::zero_data_hash,
                                     "data hash must be non-zero");
  }
  if (signature.empty()) {
    return rejected<submission_id_t>(error_code::empty_signature,
                                     "signature must be non-empty");
  }
  if (data_uri.empty()) {
    return rejected<submission_id_t>(error_code::empty_data_uri,
                                     "data uri must be non-empty");
  }
  if (data_uri.size() > kMaxDataUriSize) {
    return rejected<submission_id_t>(
        error_code::data_uri_too_long,
        fmt::format("data uri exceeds {} bytes", kMaxDataUriSize));
  }
  if (metadata.size() > kMaxMetadataSize) {
    return rejected<submission_id_t>(
        error_code::metadata_too_long,
        fmt::format("metadata exceeds {} bytes", kMaxMetadataSize));
  }

  auto write_lock = std::scoped_lock{write_mutex_};

  // Only the writer mutates the committed view, so it reads it unlocked.
  if (submissions_.contains(data_hash)) {
    return rejected<submission_id_t>(
        error_code::duplicate_data_hash,
        fmt::format("data hash {} already submitted", to_hex(data_hash)));
  }

  auto submitter = registry()->resolve_submitter(device_id);
  if (!submitter) {
    return rejected<submission_id_t>(
        error_code::device_unknown,
        fmt::format("device {} is not registered", to_hex(device_id)));
  }
  if (!submitter->device.active) {
    return rejected<submission_id_t>(
        error_code::device_inactive,
        fmt::format("device {} is inactive", to_hex(device_id)));
  }
  const auto& verifier_address = submitter->device.verifier_address;
  if (!submitter->verifier) {
    return rejected<submission_id_t>(
        error_code::verifier_unknown,
        fmt::format("verifier {} is not registered", to_hex(verifier_address)));
  }
  if (!submitter->verifier->active) {
    return rejected<submission_id_t>(
        error_code::verifier_inactive,
        fmt::format("verifier {} is inactive", to_hex(verifier_address)));
  }

  auto signer = provenance::crypto::try_make_signer(
      make_bytes_view(submitter->device.public_key));
  auto shaped = signer ? provenance::crypto::try_make_signature(
                             *signer, make_bytes_view(signature))
                       : std::nullopt;
  if (!shaped) {
    return rejected<submission_id_t>(
        error_code::malformed_signature,
        fmt::format("{}-byte signature does not fit device key",
                    signature.size()));
  }
  if (!signature_verifier_(make_bytes_view(data_hash), *signer, *shaped)) {
    return rejected<submission_id_t>(
        error_code::signature_verification_failed,
        fmt::format("signature over {} does not verify for device {}",
                    to_hex(data_hash), to_hex(device_id)));
  }

  auto submission = submission_t{};
  submission.data_hash = data_hash;
  submission.device_id = device_id;
  submission.verifier_address = verifier_address;
  submission.signature = signature;
  submission.timestamp = clock_();
  submission.data_uri = data_uri;
  submission.metadata = metadata;
  submission.verified = true;
  submission.sequence_number = history_.size();

  auto next_root = fold_state_root(encoder_, state_root_, submission);
  auto device_position = uint64_t{};
  if (auto it = device_submissions_.find(device_id);
      it != std::end(device_submissions_)) {
    device_position = it->second.size();
  }
  auto verifier_position = uint64_t{};
  if (auto it = verifier_submissions_.find(verifier_address);
      it != std::end(verifier_submissions_)) {
    verifier_position = it->second.size();
  }

  storage_.commit_batch(entries_t{
      provenance::storage::make_entry(
          encoder_, key::make_submission_key(data_hash), submission),
      provenance::storage::make_entry(
          encoder_, key::make_history_key(submission.sequence_number),
          data_hash),
      provenance::storage::make_entry(
          encoder_, key::make_device_index_key(device_id, device_position),
          data_hash),
      provenance::storage::make_entry(
          encoder_,
          key::make_verifier_index_key(verifier_address, verifier_position),
          data_hash),
      provenance::storage::make_committed_state_entry(
          provenance::storage::committed_state{
              .total_submissions = submission.sequence_number + 1,
              .state_root = next_root})});

  {
    auto state_lock = std::unique_lock{state_mutex_};
    submissions_.emplace(data_hash, submission);
    history_.push_back(data_hash);
    device_submissions_[device_id].push_back(data_hash);
    verifier_submissions_[verifier_address].push_back(data_hash);
    state_root_ = next_root;
  }

  spdlog::info("Recorded submission {} #{} from device {}", to_hex(data_hash),
               submission.sequence_number, to_hex(device_id));

  emit(data_submitted_t{.data_hash = data_hash,
                        .device_id = device_id,
                        .verifier_address = verifier_address,
                        .timestamp = submission.timestamp,
                        .data_uri = data_uri,
                        .sequence_number = submission.sequence_number});
  emit(submission_verified_t{
      .data_hash = data_hash, .device_id = device_id, .is_valid = true});

  return success(data_hash);
}

result<submission_t> submission_ledger::verify_submission(
    const hash32_t& data_hash) const {
  auto lock = std::shared_lock{state_mutex_};
  auto it = submissions_.find(data_hash);
  if (it == std::end(submissions_)) {
    return failure<submission_t>(
        error_code::submission_missing, kLedgerCodespace,
        fmt::format("data hash {} was never submitted", to_hex(data_hash)));
  }
  return success(it->second);
}

result<bool> submission_ledger::verify_data_integrity(
    const hash32_t& data_hash,
    const bytes_view_t& data) const {
  if (!has_submission(data_hash)) {
    return failure<bool>(
        error_code::submission_missing, kLedgerCodespace,
        fmt::format("data hash {} was never submitted", to_hex(data_hash)));
  }
  return success(provenance::crypto::content_hash(content_hash_, data) ==
                 data_hash);
}

std::vector<hash32_t> submission_ledger::get_device_submissions(
    const device_id_t& device_id) const {
  auto lock = std::shared_lock{state_mutex_};
  auto it = device_submissions_.find(device_id);
  if (it == std::end(device_submissions_)) {
    return {};
  }
  return it->second;
}

std::vector<hash32_t> submission_ledger::get_verifier_submissions(
    const address_t& verifier_address) const {
  auto lock = std::shared_lock{state_mutex_};
  auto it = verifier_submissions_.find(verifier_address);
  if (it == std::end(verifier_submissions_)) {
    return {};
  }
  return it->second;
}

result<submission_details_t> submission_ledger::get_submission_details(
    const hash32_t& data_hash) const {
  auto submission = verify_submission(data_hash);
  if (!submission.ok()) {
    return forward_failure<submission_details_t>(submission);
  }

  auto current = registry();
  auto device = current->get_device(submission.value->device_id);
  if (!device.ok()) {
    return forward_failure<submission_details_t>(device);
  }
  auto verifier = current->get_verifier(submission.value->verifier_address);
  if (!verifier.ok()) {
    return forward_failure<submission_details_t>(verifier);
  }

  auto details = submission_details_t{};
  details.submission = std::move(*submission.value);
  details.device = std::move(*device.value);
  details.verifier = std::move(*verifier.value);
  return success(std::move(details));
}

bool submission_ledger::has_submission(const hash32_t& data_hash) const {
  auto lock = std::shared_lock{state_mutex_};
  return submissions_.contains(data_hash);
}

uint64_t submission_ledger::get_total_submissions() const {
  auto lock = std::shared_lock{state_mutex_};
  return history_.size();
}

result<std::vector<hash32_t>> submission_ledger::get_submission_history(
    const uint64_t start,
    const uint64_t count) const {
  auto lock = std::shared_lock{state_mutex_};
  auto total = static_cast<uint64_t>(history_.size());
  if (start >= total) {
    return failure<std::vector<hash32_t>>(
        error_code::history_start_out_of_range, kLedgerCodespace,
        fmt::format("start {} is beyond total {}", start, total));
  }
  auto end = start + std::min(count, total - start);
  return success(std::vector<hash32_t>{
      std::begin(history_) + static_cast<std::ptrdiff_t>(start),
      std::begin(history_) + static_cast<std::ptrdiff_t>(end)});
}

result<void_t> submission_ledger::update_registry(
    const admin_grant_t& grant,
    std::shared_ptr<provenance::registry::trust_registry> replacement) {
  if (!replacement) {
    return rejected<void_t>(error_code::invalid_registry,
                            "replacement registry must be non-null");
  }

  auto write_lock = std::scoped_lock{write_mutex_};
  auto authorized = authority_.authorize(
      admin_operation::update_registry,
      make_bytes_view(
          provenance::registry::make_update_registry_subject(
              replacement->id())),
      grant);
  if (!authorized.ok()) {
    return forward_failure<void_t>(authorized);
  }

  storage_.commit_batch(entries_t{std::move(*authorized.value)});
  auto previous = registry();
  {
    auto lock = std::scoped_lock{registry_mutex_};
    registry_ = std::move(replacement);
  }
  spdlog::info("Ledger now consults registry {} (was {})",
               to_hex(registry()->id()), to_hex(previous->id()));
  return success();
}

subscription_id_t submission_ledger::subscribe(event_sink_t sink) {
  auto lock = std::scoped_lock{subscriber_mutex_};
  auto id = next_subscription_id_++;
  subscribers_.emplace(id, std::move(sink));
  return id;
}

bool submission_ledger::unsubscribe(const subscription_id_t id) {
  auto lock = std::scoped_lock{subscriber_mutex_};
  return subscribers_.erase(id) > 0;
}

ledger_info_t submission_ledger::info() const {
  auto out = ledger_info_t{};
  {
    auto lock = std::shared_lock{state_mutex_};
    out.total_submissions = history_.size();
    out.state_root = state_root_;
  }
  out.content_hash = content_hash_;
  out.registry_id = registry()->id();
  return out;
}

audit_result_t submission_ledger::audit_state_root() const {
  auto write_lock = std::scoped_lock{write_mutex_};
  auto out = audit_result_t{};
  {
    auto lock = std::shared_lock{state_mutex_};
    out.live_root = state_root_;
  }

  auto log = load_submission_log(encoder_, storage_, out.error);
  auto root = make_zero_hash();
  for (const auto& submission : log) {
    root = fold_state_root(encoder_, root, submission);
  }
  out.checked = log.size();
  out.recomputed_root = root;
  if (out.error.empty() && root != out.live_root) {
    out.error = "recomputed state root differs from live root";
  }
  out.consistent = out.error.empty();
  if (out.consistent) {
    spdlog::info("State root audit passed over {} submission(s)", out.checked);
  } else {
    spdlog::error("State root audit failed after {} submission(s): {}",
                  out.checked, out.error);
  }
  return out;
}

void submission_ledger::set_clock(clock_source_t clock) {
  auto lock = std::scoped_lock{write_mutex_};
  clock_ = std::move(clock);
}

void submission_ledger::set_signature_verifier(
    provenance::crypto::signature_verifier_t verifier) {
  auto lock = std::scoped_lock{write_mutex_};
  signature_verifier_ = std::move(verifier);
}

std::shared_ptr<provenance::registry::trust_registry>
submission_ledger::registry() const {
  auto lock = std::scoped_lock{registry_mutex_};
  return registry_;
}

// Called with write_mutex_ held so that subscribers see commit order. Sinks
// must not call back into any member that takes write_mutex_: submit_data,
// update_registry, audit_state_root, set_clock or set_signature_verifier.
void submission_ledger::emit(const ledger_event_t& event) {
  auto sinks = std::vector<event_sink_t>{};
  {
    auto lock = std::scoped_lock{subscriber_mutex_};
    for (const auto& [id, sink] : subscribers_) {
      sinks.push_back(sink);
    }
  }
  for (const auto& sink : sinks) {
    try {
      sink(event);
    } catch (const std::exception& ex) {
      spdlog::error("Ledger event subscriber failed: {}", ex.what());
    } catch (...) {
      spdlog::error("Ledger event subscriber failed with a non-standard "
                    "exception");
    }
  }
}

void submission_ledger::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  auto error = std::string{};
  auto log = load_submission_log(encoder_, storage_, error);
  if (!error.empty()) {
    spdlog::error("Ledger log is inconsistent: {}", error);
    provenance::common::critical("ledger log is inconsistent");
  }

  auto root = make_zero_hash();
  for (auto& submission : log) {
    root = fold_state_root(encoder_, root, submission);
    history_.push_back(submission.data_hash);
    device_submissions_[submission.device_id].push_back(submission.data_hash);
    verifier_submissions_[submission.verifier_address].push_back(
        submission.data_hash);
    submissions_.emplace(submission.data_hash, std::move(submission));
  }
  state_root_ = root;

  auto committed = storage_.load_committed_state();
  auto expected = committed.value_or(provenance::storage::committed_state{});
  if (expected.total_submissions != history_.size() ||
      expected.state_root != state_root_) {
    spdlog::error(
        "Committed state ({} submissions, root {}) disagrees with log ({}, {})",
        expected.total_submissions, to_hex(expected.state_root),
        history_.size(), to_hex(state_root_));
    provenance::common::critical("ledger committed state mismatch");
  }

  auto submission_rows = storage_.list_by_prefix(make_bytes_view(
      key::make_prefix_key(key::kSubmissionKeyPrefix)));
  if (submission_rows.size() != history_.size()) {
    provenance::common::critical("submission rows disagree with history");
  }
  if (load_index(encoder_, storage_, key::kDeviceIndexKeyPrefix) !=
          device_submissions_ ||
      load_index(encoder_, storage_, key::kVerifierIndexKeyPrefix) !=
          verifier_submissions_) {
    provenance::common::critical("ledger index rows disagree with history");
  }
}

}  // namespace provenance::ledger
