#pragma once

#include <provenance/v1/ledger.grpc.pb.h>
#include <provenance/ledger/submission_ledger.hpp>
#include <provenance/registry/admin_authority.hpp>

namespace provenance::rpc {

inline constexpr std::string_view kRpcCodespace{"provenance.rpc"};

/// Callback gRPC front end for the submission ledger and the registry it
/// currently consults.
///
/// Every handler finishes with transport status OK; outcomes travel in the
/// response `code`, `log` and `codespace` fields. Registry repointing stays
/// in-process and has no RPC.
struct listener final : public provenance::v1::Ledger::CallbackService {
  listener(provenance::ledger::submission_ledger& ledger,
           provenance::registry::admin_authority& authority);

  /// Validate, verify and append one signed submission.
  virtual grpc::ServerUnaryReactor* SubmitData(
      grpc::CallbackServerContext* context,
      const provenance::v1::SubmitDataRequest* request,
      provenance::v1::SubmitDataResponse* response) override final;

  virtual grpc::ServerUnaryReactor* VerifySubmission(
      grpc::CallbackServerContext* context,
      const provenance::v1::VerifySubmissionRequest* request,
      provenance::v1::VerifySubmissionResponse* response) override final;

  /// Re-hash caller supplied bytes and compare with a submitted hash.
  virtual grpc::ServerUnaryReactor* VerifyDataIntegrity(
      grpc::CallbackServerContext* context,
      const provenance::v1::VerifyDataIntegrityRequest* request,
      provenance::v1::VerifyDataIntegrityResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetDeviceSubmissions(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetDeviceSubmissionsRequest* request,
      provenance::v1::HashListResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetVerifierSubmissions(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetVerifierSubmissionsRequest* request,
      provenance::v1::HashListResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetSubmissionDetails(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetSubmissionDetailsRequest* request,
      provenance::v1::GetSubmissionDetailsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* HasSubmission(
      grpc::CallbackServerContext* context,
      const provenance::v1::HasSubmissionRequest* request,
      provenance::v1::HasSubmissionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTotalSubmissions(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetTotalSubmissionsRequest* request,
      provenance::v1::GetTotalSubmissionsResponse* response) override final;

  /// Audit pagination over the global insertion order.
  virtual grpc::ServerUnaryReactor* GetSubmissionHistory(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetSubmissionHistoryRequest* request,
      provenance::v1::HashListResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const provenance::v1::InfoRequest* request,
      provenance::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* AuditStateRoot(
      grpc::CallbackServerContext* context,
      const provenance::v1::AuditStateRootRequest* request,
      provenance::v1::AuditStateRootResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterVerifier(
      grpc::CallbackServerContext* context,
      const provenance::v1::RegisterVerifierRequest* request,
      provenance::v1::VerifierResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SetVerifierActive(
      grpc::CallbackServerContext* context,
      const provenance::v1::SetVerifierActiveRequest* request,
      provenance::v1::VerifierResponse* response) override final;

  virtual grpc::ServerUnaryReactor* RegisterDevice(
      grpc::CallbackServerContext* context,
      const provenance::v1::RegisterDeviceRequest* request,
      provenance::v1::DeviceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* SetDeviceActive(
      grpc::CallbackServerContext* context,
      const provenance::v1::SetDeviceActiveRequest* request,
      provenance::v1::DeviceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetVerifier(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetVerifierRequest* request,
      provenance::v1::VerifierResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetDevice(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetDeviceRequest* request,
      provenance::v1::DeviceResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetVerifierDevices(
      grpc::CallbackServerContext* context,
      const provenance::v1::GetVerifierDevicesRequest* request,
      provenance::v1::GetVerifierDevicesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsVerifierActive(
      grpc::CallbackServerContext* context,
      const provenance::v1::IsVerifierActiveRequest* request,
      provenance::v1::ActivityResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IsDeviceActive(
      grpc::CallbackServerContext* context,
      const provenance::v1::IsDeviceActiveRequest* request,
      provenance::v1::ActivityResponse* response) override final;

  provenance::ledger::submission_ledger& ledger_;
  provenance::registry::admin_authority& authority_;
};

}  // namespace provenance::rpc
