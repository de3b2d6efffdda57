#include <gtest/gtest.h>
#include <provenance/rpc/server.hpp>
#include <provenance/testing/ledger_fixture.hpp>

#include <string>

namespace {

using provenance::schema::error_code;
using provenance::testing::hash_payload;
using provenance::testing::make_hash;

uint32_t code_of(const error_code code) {
  return static_cast<uint32_t>(code);
}

void set_grant(provenance::v1::AdminGrant* destination,
               const provenance::schema::admin_grant_t& grant) {
  destination->set_nonce(grant.nonce);
  destination->set_signature(provenance::schema::make_string(grant.signature));
}

}  // namespace

TEST(rpc_server, registry_administration_round_trip) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_rpc_admin"};
  auto listener =
      provenance::rpc::listener{fixture.ledger(), fixture.authority()};
  auto verifier = make_hash(1);
  auto device_key = provenance::crypto::key_pair::generate(
                        provenance::schema::signature_scheme::ed25519)
                        .value();

  {
    auto request = provenance::v1::RegisterVerifierRequest{};
    set_grant(request.mutable_grant(),
              fixture.grant(
                  provenance::schema::admin_operation::register_verifier,
                  provenance::registry::make_register_verifier_subject(
                      verifier, "Lab", "{}")));
    request.set_address(provenance::schema::make_string(verifier));
    request.set_name("Lab");
    request.set_metadata("{}");
    auto response = provenance::v1::VerifierResponse{};
    auto context = grpc::CallbackServerContext{};
    auto* reactor = listener.RegisterVerifier(&context, &request, &response);
    ASSERT_NE(reactor, nullptr);
    ASSERT_EQ(response.code(), 0u) << response.log();
    EXPECT_EQ(response.verifier().name(), "Lab");
    EXPECT_TRUE(response.verifier().active());
  }

  {
    auto request = provenance::v1::RegisterDeviceRequest{};
    set_grant(request.mutable_grant(),
              fixture.grant(
                  provenance::schema::admin_operation::register_device,
                  provenance::registry::make_register_device_subject(
                      make_hash(2), verifier, device_key.public_key(), "")));
    request.set_device_id(provenance::schema::make_string(make_hash(2)));
    request.set_verifier_address(provenance::schema::make_string(verifier));
    request.set_public_key(
        provenance::schema::make_string(device_key.public_key()));
    auto response = provenance::v1::DeviceResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.RegisterDevice(&context, &request, &response);
    ASSERT_EQ(response.code(), 0u) << response.log();
    EXPECT_EQ(response.device().verifier_address(),
              provenance::schema::make_string(verifier));
  }

  {
    auto request = provenance::v1::GetVerifierDevicesRequest{};
    request.set_address(provenance::schema::make_string(verifier));
    auto response = provenance::v1::GetVerifierDevicesResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetVerifierDevices(&context, &request, &response);
    ASSERT_EQ(response.device_ids_size(), 1);
    EXPECT_EQ(response.device_ids(0),
              provenance::schema::make_string(make_hash(2)));
  }

  {
    // Replaying the consumed nonce is refused.
    auto request = provenance::v1::SetDeviceActiveRequest{};
    request.mutable_grant()->set_nonce(1);
    request.set_device_id(provenance::schema::make_string(make_hash(2)));
    request.set_active(false);
    auto response = provenance::v1::DeviceResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.SetDeviceActive(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::admin_nonce_mismatch));
    EXPECT_EQ(response.codespace(), provenance::registry::kAdminCodespace);
  }

  {
    auto request = provenance::v1::IsDeviceActiveRequest{};
    request.set_device_id(provenance::schema::make_string(make_hash(2)));
    auto response = provenance::v1::ActivityResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.IsDeviceActive(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_TRUE(response.active());
  }
}

TEST(rpc_server, submit_and_query_map_ledger_outcomes) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_rpc_submit"};
  auto listener =
      provenance::rpc::listener{fixture.ledger(), fixture.authority()};
  auto verifier = make_hash(10);
  auto device = make_hash(11);
  auto key = provenance::crypto::key_pair::generate(
                 provenance::schema::signature_scheme::secp256k1)
                 .value();
  ASSERT_TRUE(fixture.register_verifier(verifier).ok());
  ASSERT_TRUE(fixture.register_device(device, verifier, key.public_key()).ok());

  auto data_hash = hash_payload("telemetry");
  auto submit = provenance::v1::SubmitDataRequest{};
  submit.set_device_id(provenance::schema::make_string(device));
  submit.set_data_hash(provenance::schema::make_string(data_hash));
  submit.set_signature(provenance::schema::make_string(
      provenance::testing::sign_hash(key, data_hash)));
  submit.set_data_uri("ipfs://telemetry");
  submit.set_metadata("{}");
  {
    auto response = provenance::v1::SubmitDataResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.SubmitData(&context, &submit, &response);
    ASSERT_EQ(response.code(), 0u) << response.log();
    EXPECT_EQ(response.submission_id(),
              provenance::schema::make_string(data_hash));
  }
  {
    auto response = provenance::v1::SubmitDataResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.SubmitData(&context, &submit, &response);
    EXPECT_EQ(response.code(), code_of(error_code::duplicate_data_hash));
    EXPECT_EQ(response.codespace(), provenance::ledger::kLedgerCodespace);
    EXPECT_FALSE(response.log().empty());
    EXPECT_TRUE(response.submission_id().empty());
  }
  {
    auto request = provenance::v1::GetSubmissionDetailsRequest{};
    request.set_data_hash(provenance::schema::make_string(data_hash));
    auto response = provenance::v1::GetSubmissionDetailsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetSubmissionDetails(&context, &request, &response);
    ASSERT_EQ(response.code(), 0u) << response.log();
    EXPECT_EQ(response.submission().data_uri(), "ipfs://telemetry");
    EXPECT_EQ(response.submission().sequence_number(), 0u);
    EXPECT_TRUE(response.submission().verified());
    EXPECT_EQ(response.device().public_key(),
              provenance::schema::make_string(key.public_key()));
    EXPECT_EQ(response.verifier().address(),
              provenance::schema::make_string(verifier));
  }
  {
    auto request = provenance::v1::VerifyDataIntegrityRequest{};
    request.set_data_hash(provenance::schema::make_string(data_hash));
    request.set_data("telemetry");
    auto response = provenance::v1::VerifyDataIntegrityResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.VerifyDataIntegrity(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_TRUE(response.matches());
  }
  {
    auto request = provenance::v1::GetSubmissionHistoryRequest{};
    request.set_start(0);
    request.set_count(10);
    auto response = provenance::v1::HashListResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetSubmissionHistory(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    ASSERT_EQ(response.data_hashes_size(), 1);
    EXPECT_EQ(response.data_hashes(0),
              provenance::schema::make_string(data_hash));
  }
  {
    auto request = provenance::v1::GetSubmissionHistoryRequest{};
    request.set_start(1);
    request.set_count(1);
    auto response = provenance::v1::HashListResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetSubmissionHistory(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::history_start_out_of_range));
    EXPECT_EQ(response.data_hashes_size(), 0);
  }
  {
    auto request = provenance::v1::VerifySubmissionRequest{};
    request.set_data_hash(provenance::schema::make_string(make_hash(99)));
    auto response = provenance::v1::VerifySubmissionResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.VerifySubmission(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::submission_missing));
    EXPECT_FALSE(response.has_submission());
  }
}

TEST(rpc_server, malformed_identifiers_are_rejected_before_the_ledger) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{"provenance_rpc_malformed"};
  auto listener =
      provenance::rpc::listener{fixture.ledger(), fixture.authority()};

  {
    auto request = provenance::v1::SubmitDataRequest{};
    request.set_device_id(std::string(31, 'd'));
    request.set_data_hash(std::string(32, 'h'));
    request.set_signature("sig");
    request.set_data_uri("ipfs://m");
    auto response = provenance::v1::SubmitDataResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.SubmitData(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::malformed_identifier));
    EXPECT_EQ(response.codespace(), provenance::rpc::kRpcCodespace);
  }
  {
    auto request = provenance::v1::HasSubmissionRequest{};
    request.set_data_hash("short");
    auto response = provenance::v1::HasSubmissionResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.HasSubmission(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::malformed_identifier));
    EXPECT_FALSE(response.exists());
  }
  {
    auto request = provenance::v1::GetVerifierRequest{};
    auto response = provenance::v1::VerifierResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetVerifier(&context, &request, &response);
    EXPECT_EQ(response.code(), code_of(error_code::malformed_identifier));
  }
  {
    // Well-formed but unknown principals are lookups, not errors.
    auto request = provenance::v1::IsVerifierActiveRequest{};
    request.set_address(provenance::schema::make_string(make_hash(5)));
    auto response = provenance::v1::ActivityResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.IsVerifierActive(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_FALSE(response.active());
  }
  {
    auto request = provenance::v1::GetDeviceSubmissionsRequest{};
    request.set_device_id(provenance::schema::make_string(make_hash(6)));
    auto response = provenance::v1::HashListResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetDeviceSubmissions(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_EQ(response.data_hashes_size(), 0);
  }
}

TEST(rpc_server, info_and_audit_report_ledger_state) {
  if (!provenance::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = provenance::testing::ledger_fixture{
      "provenance_rpc_info", provenance::schema::signature_scheme::ed25519,
      provenance::schema::content_hash_algorithm::blake3};
  auto listener =
      provenance::rpc::listener{fixture.ledger(), fixture.authority()};
  auto verifier = make_hash(20);
  auto key = provenance::crypto::key_pair::generate(
                 provenance::schema::signature_scheme::ed25519)
                 .value();
  ASSERT_TRUE(fixture.register_verifier(verifier).ok());
  ASSERT_TRUE(
      fixture.register_device(make_hash(21), verifier, key.public_key()).ok());
  ASSERT_TRUE(fixture.submit(make_hash(21), key, "one").ok());
  ASSERT_TRUE(fixture.submit(make_hash(21), key, "two").ok());

  {
    auto request = provenance::v1::InfoRequest{};
    auto response = provenance::v1::InfoResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Info(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_EQ(response.name(), "provenance-ledger");
    EXPECT_EQ(response.total_submissions(), 2u);
    EXPECT_EQ(response.content_hash(), "blake3");
    EXPECT_EQ(response.state_root(),
              provenance::schema::make_string(
                  fixture.ledger().info().state_root));
    EXPECT_EQ(response.registry_id(),
              provenance::schema::make_string(provenance::testing::kRegistryId));
    EXPECT_EQ(response.next_admin_nonce(), 3u);
  }
  {
    auto request = provenance::v1::GetTotalSubmissionsRequest{};
    auto response = provenance::v1::GetTotalSubmissionsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.GetTotalSubmissions(&context, &request, &response);
    EXPECT_EQ(response.total(), 2u);
  }
  {
    auto request = provenance::v1::AuditStateRootRequest{};
    auto response = provenance::v1::AuditStateRootResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.AuditStateRoot(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    EXPECT_TRUE(response.consistent());
    EXPECT_EQ(response.checked(), 2u);
    EXPECT_EQ(response.live_root(), response.recomputed_root());
  }
}
