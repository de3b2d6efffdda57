#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <provenance/rpc/server.hpp>
#include <optional>
#include <string>
#include <string_view>

using namespace provenance::rpc;
using namespace provenance::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

template <typename Response, typename T>
void set_outcome(Response* response, const result<T>& outcome) {
  response->set_code(static_cast<uint32_t>(outcome.code));
  response->set_log(outcome.log);
  response->set_codespace(outcome.codespace);
}

template <typename Response>
void set_malformed(Response* response, const std::string_view field) {
  response->set_code(static_cast<uint32_t>(error_code::malformed_identifier));
  response->set_log(fmt::format("{} must be exactly 32 bytes", field));
  response->set_codespace(std::string{kRpcCodespace});
}

std::optional<hash32_t> parse_id(const std::string& raw) {
  return try_make_hash32(make_bytes_view(raw));
}

admin_grant_t make_grant(const provenance::v1::AdminGrant& grant) {
  auto out = admin_grant_t{};
  out.nonce = grant.nonce();
  out.signature = make_bytes(grant.signature());
  return out;
}

void populate(provenance::v1::Verifier* destination, const verifier_t& source) {
  destination->set_address(make_string(source.address));
  destination->set_name(source.name);
  destination->set_metadata(source.metadata);
  destination->set_active(source.active);
  destination->set_registered_at(source.registered_at);
}

void populate(provenance::v1::Device* destination, const device_t& source) {
  destination->set_device_id(make_string(source.device_id));
  destination->set_verifier_address(make_string(source.verifier_address));
  destination->set_public_key(make_string(source.public_key));
  destination->set_metadata(source.metadata);
  destination->set_active(source.active);
  destination->set_registered_at(source.registered_at);
}

void populate(provenance::v1::Submission* destination,
              const submission_t& source) {
  destination->set_data_hash(make_string(source.data_hash));
  destination->set_device_id(make_string(source.device_id));
  destination->set_verifier_address(make_string(source.verifier_address));
  destination->set_signature(make_string(source.signature));
  destination->set_timestamp(source.timestamp);
  destination->set_data_uri(source.data_uri);
  destination->set_metadata(source.metadata);
  destination->set_verified(source.verified);
  destination->set_sequence_number(source.sequence_number);
}

void populate(provenance::v1::HashListResponse* response,
              const std::vector<hash32_t>& hashes) {
  for (const auto& hash : hashes) {
    response->add_data_hashes(make_string(hash));
  }
}

}  // namespace

listener::listener(provenance::ledger::submission_ledger& ledger,
                   provenance::registry::admin_authority& authority)
    : ledger_{ledger}, authority_{authority} {}

grpc::ServerUnaryReactor* listener::SubmitData(
    grpc::CallbackServerContext* context,
    const provenance::v1::SubmitDataRequest* request,
    provenance::v1::SubmitDataResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  auto data_hash = parse_id(request->data_hash());
  if (!data_hash) {
    set_malformed(response, "data_hash");
    return finish_ok(context);
  }
  auto outcome =
      ledger_.submit_data(*device_id, *data_hash,
                          make_bytes(request->signature()),
                          request->data_uri(), request->metadata());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    response->set_submission_id(make_string(*outcome.value));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifySubmission(
    grpc::CallbackServerContext* context,
    const provenance::v1::VerifySubmissionRequest* request,
    provenance::v1::VerifySubmissionResponse* response) {
  auto data_hash = parse_id(request->data_hash());
  if (!data_hash) {
    set_malformed(response, "data_hash");
    return finish_ok(context);
  }
  auto outcome = ledger_.verify_submission(*data_hash);
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_submission(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::VerifyDataIntegrity(
    grpc::CallbackServerContext* context,
    const provenance::v1::VerifyDataIntegrityRequest* request,
    provenance::v1::VerifyDataIntegrityResponse* response) {
  auto data_hash = parse_id(request->data_hash());
  if (!data_hash) {
    set_malformed(response, "data_hash");
    return finish_ok(context);
  }
  auto outcome = ledger_.verify_data_integrity(
      *data_hash, make_bytes_view(request->data()));
  set_outcome(response, outcome);
  if (outcome.ok()) {
    response->set_matches(*outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetDeviceSubmissions(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetDeviceSubmissionsRequest* request,
    provenance::v1::HashListResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  populate(response, ledger_.get_device_submissions(*device_id));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetVerifierSubmissions(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetVerifierSubmissionsRequest* request,
    provenance::v1::HashListResponse* response) {
  auto address = parse_id(request->verifier_address());
  if (!address) {
    set_malformed(response, "verifier_address");
    return finish_ok(context);
  }
  populate(response, ledger_.get_verifier_submissions(*address));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetSubmissionDetails(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetSubmissionDetailsRequest* request,
    provenance::v1::GetSubmissionDetailsResponse* response) {
  auto data_hash = parse_id(request->data_hash());
  if (!data_hash) {
    set_malformed(response, "data_hash");
    return finish_ok(context);
  }
  auto outcome = ledger_.get_submission_details(*data_hash);
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_submission(), outcome.value->submission);
    populate(response->mutable_device(), outcome.value->device);
    populate(response->mutable_verifier(), outcome.value->verifier);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::HasSubmission(
    grpc::CallbackServerContext* context,
    const provenance::v1::HasSubmissionRequest* request,
    provenance::v1::HasSubmissionResponse* response) {
  auto data_hash = parse_id(request->data_hash());
  if (!data_hash) {
    set_malformed(response, "data_hash");
    return finish_ok(context);
  }
  response->set_exists(ledger_.has_submission(*data_hash));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTotalSubmissions(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetTotalSubmissionsRequest*,
    provenance::v1::GetTotalSubmissionsResponse* response) {
  response->set_total(ledger_.get_total_submissions());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetSubmissionHistory(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetSubmissionHistoryRequest* request,
    provenance::v1::HashListResponse* response) {
  auto outcome =
      ledger_.get_submission_history(request->start(), request->count());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response, *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const provenance::v1::InfoRequest*,
    provenance::v1::InfoResponse* response) {
  auto info = ledger_.info();
  response->set_name(info.name);
  response->set_version(info.version);
  response->set_total_submissions(info.total_submissions);
  response->set_state_root(make_string(info.state_root));
  response->set_content_hash(std::string{to_string(info.content_hash)});
  response->set_registry_id(make_string(info.registry_id));
  response->set_next_admin_nonce(authority_.next_nonce());
  spdlog::debug("Info: {} submission(s), root {}", info.total_submissions,
                to_hex(info.state_root));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::AuditStateRoot(
    grpc::CallbackServerContext* context,
    const provenance::v1::AuditStateRootRequest*,
    provenance::v1::AuditStateRootResponse* response) {
  auto audit = ledger_.audit_state_root();
  response->set_consistent(audit.consistent);
  response->set_checked(audit.checked);
  response->set_live_root(make_string(audit.live_root));
  response->set_recomputed_root(make_string(audit.recomputed_root));
  response->set_error(audit.error);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterVerifier(
    grpc::CallbackServerContext* context,
    const provenance::v1::RegisterVerifierRequest* request,
    provenance::v1::VerifierResponse* response) {
  auto address = parse_id(request->address());
  if (!address) {
    set_malformed(response, "address");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->register_verifier(
      make_grant(request->grant()), *address, request->name(),
      request->metadata());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_verifier(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SetVerifierActive(
    grpc::CallbackServerContext* context,
    const provenance::v1::SetVerifierActiveRequest* request,
    provenance::v1::VerifierResponse* response) {
  auto address = parse_id(request->address());
  if (!address) {
    set_malformed(response, "address");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->set_verifier_active(
      make_grant(request->grant()), *address, request->active());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_verifier(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::RegisterDevice(
    grpc::CallbackServerContext* context,
    const provenance::v1::RegisterDeviceRequest* request,
    provenance::v1::DeviceResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  auto address = parse_id(request->verifier_address());
  if (!address) {
    set_malformed(response, "verifier_address");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->register_device(
      make_grant(request->grant()), *device_id, *address,
      make_bytes(request->public_key()), request->metadata());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_device(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::SetDeviceActive(
    grpc::CallbackServerContext* context,
    const provenance::v1::SetDeviceActiveRequest* request,
    provenance::v1::DeviceResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->set_device_active(
      make_grant(request->grant()), *device_id, request->active());
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_device(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetVerifier(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetVerifierRequest* request,
    provenance::v1::VerifierResponse* response) {
  auto address = parse_id(request->address());
  if (!address) {
    set_malformed(response, "address");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->get_verifier(*address);
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_verifier(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetDevice(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetDeviceRequest* request,
    provenance::v1::DeviceResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->get_device(*device_id);
  set_outcome(response, outcome);
  if (outcome.ok()) {
    populate(response->mutable_device(), *outcome.value);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetVerifierDevices(
    grpc::CallbackServerContext* context,
    const provenance::v1::GetVerifierDevicesRequest* request,
    provenance::v1::GetVerifierDevicesResponse* response) {
  auto address = parse_id(request->address());
  if (!address) {
    set_malformed(response, "address");
    return finish_ok(context);
  }
  auto outcome = ledger_.registry()->get_verifier_devices(*address);
  set_outcome(response, outcome);
  if (outcome.ok()) {
    for (const auto& device_id : *outcome.value) {
      response->add_device_ids(make_string(device_id));
    }
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IsVerifierActive(
    grpc::CallbackServerContext* context,
    const provenance::v1::IsVerifierActiveRequest* request,
    provenance::v1::ActivityResponse* response) {
  auto address = parse_id(request->address());
  if (!address) {
    set_malformed(response, "address");
    return finish_ok(context);
  }
  response->set_active(ledger_.registry()->is_verifier_active(*address));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::IsDeviceActive(
    grpc::CallbackServerContext* context,
    const provenance::v1::IsDeviceActiveRequest* request,
    provenance::v1::ActivityResponse* response) {
  auto device_id = parse_id(request->device_id());
  if (!device_id) {
    set_malformed(response, "device_id");
    return finish_ok(context);
  }
  response->set_active(ledger_.registry()->is_device_active(*device_id));
  return finish_ok(context);
}
